#include <texel/asset/asset_server.h>
#include <texel/core/config.h>
#include <texel/core/error.h>
#include <texel/core/log.h>
#include <texel/render/render_device.h>
#include <texel/render/texture/image_loader.h>
#include <texel/render/texture/texture_format.h>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace texel;

/**
 * image_info - decode an image through the asset server and describe it
 *
 * Without --config the file's directory becomes the asset root.
 */
int main(int argc, char** argv) {
    CLI::App cli{"texel_image_info - inspect an image asset"};

    std::filesystem::path file;
    std::filesystem::path config_path;
    std::string settings_text;
    bool bc = false;
    bool astc = false;
    bool etc2 = false;

    cli.add_option("file", file, "Image path (relative to the asset root when --config is given)")
        ->required();
    cli.add_option("--config", config_path, "Application config (JSON)")
        ->check(CLI::ExistingFile);
    cli.add_option("--settings", settings_text, "Image loader settings (JSON)");
    cli.add_flag("--bc", bc, "Device supports BC compressed textures");
    cli.add_flag("--astc", astc, "Device supports ASTC LDR compressed textures");
    cli.add_flag("--etc2", etc2, "Device supports ETC2 compressed textures");

    CLI11_PARSE(cli, argc, argv);

    try {
        config::AppConfig app_config;
        std::filesystem::path asset_path = file;
        if (!config_path.empty()) {
            app_config = config::load_from_file(config_path);
        } else {
            app_config.asset_root = file.has_parent_path() ? file.parent_path() : std::filesystem::path(".");
            asset_path = file.filename();
        }
        texel::log::init(app_config.log_level);

        std::optional<config::DeviceConfig> device = app_config.device;
        if (bc || astc || etc2) {
            device = config::DeviceConfig{bc, astc, etc2};
        }

        nlohmann::json settings = nullptr;
        if (!settings_text.empty()) {
            settings = nlohmann::json::parse(settings_text, nullptr, false);
            if (settings.is_discarded()) {
                throw ConfigError("--settings is not valid JSON");
            }
        }

        app::World world;
        auto server = std::make_shared<asset::AssetServer>(app_config);
        world.InsertResource(server);
        if (device) {
            world.EmplaceResource<render::RenderDevice>(render::RenderDevice::FromConfig(*device));
        }
        server->InitLoader<render::ImageLoader>(world);

        auto result = server->Load<render::Image>(asset_path, settings).get();
        if (!result) {
            throw AssetError(result.GetError().Message);
        }

        const render::Image& image = *result.Value();
        std::cout << "file:       " << (app_config.asset_root / asset_path).string() << "\n"
                  << "format:     " << render::FormatName(image.format) << "\n"
                  << "size:       " << image.Width() << "x" << image.Height() << "\n"
                  << "layers:     " << image.extent.z << (image.is_cubemap ? " (cubemap)" : "") << "\n"
                  << "mip levels: " << image.mip_level_count << "\n"
                  << "bytes:      " << image.data.size() << "\n";

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
