// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <memory>
#include <typeindex>
#include <unordered_map>
#include <utility>

namespace texel::app {

/**
 * @brief Type-indexed store of shared resources (render device, asset server, ...)
 *
 * At most one resource per type. Loaders read it at construction time to pick up
 * optional collaborators; a missing resource is reported as nullptr.
 */
class World {
public:
    World() = default;

    template<typename T>
    void InsertResource(std::shared_ptr<T> resource) {
        resources_[std::type_index(typeid(T))] = std::move(resource);
    }

    template<typename T, typename... Args>
    T& EmplaceResource(Args&&... args) {
        auto resource = std::make_shared<T>(std::forward<Args>(args)...);
        T& ref = *resource;
        InsertResource<T>(std::move(resource));
        return ref;
    }

    template<typename T>
    T* GetResource() const {
        auto it = resources_.find(std::type_index(typeid(T)));
        if (it == resources_.end()) {
            return nullptr;
        }
        return static_cast<T*>(it->second.get());
    }

    template<typename T>
    std::shared_ptr<T> GetSharedResource() const {
        auto it = resources_.find(std::type_index(typeid(T)));
        if (it == resources_.end()) {
            return nullptr;
        }
        return std::static_pointer_cast<T>(it->second);
    }

    template<typename T>
    bool ContainsResource() const {
        return resources_.count(std::type_index(typeid(T))) != 0;
    }

    template<typename T>
    void RemoveResource() {
        resources_.erase(std::type_index(typeid(T)));
    }

private:
    std::unordered_map<std::type_index, std::shared_ptr<void>> resources_;
};

/**
 * @brief Constructs T from the world, mirroring a FromWorld constructor when T has one
 */
template<typename T>
T FromWorld(World& world) {
    if constexpr (requires { T::FromWorld(world); }) {
        return T::FromWorld(world);
    } else {
        return T();
    }
}

} // namespace texel::app
