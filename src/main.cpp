#include "app.hpp"
#include "util.hpp"
#include "config.hpp"
#include "image_error.hpp"

#include <string>
#include <iostream>
#include <stdexcept>


namespace {

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config FILE] [--image PATH] [--mode free|timed|challenge] [--grid RxC]" << std::endl;
}

AppOptions parse_args(int argc, char** argv) {
    AppOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "--config") {
            options.config_path = next();
        }
        else if (arg == "--image") {
            options.image_path = next();
        }
        else if (arg == "--mode") {
            std::string value = next();
            options.mode = Util::parse_mode(value);
            if (!options.mode) {
                throw std::invalid_argument("Unknown mode: " + value);
            }
        }
        else if (arg == "--grid") {
            std::string value = next();
            options.grid = Util::parse_grid(value);
            if (!options.grid) {
                throw std::invalid_argument("Grid must look like 3x4, got: " + value);
            }
        }
        else {
            throw std::invalid_argument("Unknown argument: " + arg);
        }
    }
    return options;
}

}

int main(int argc, char** argv) {
    AppOptions options;
    try {
        options = parse_args(argc, argv);
    }
    catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    try {
        Config config = Config::load(options.config_path);
        App app(config);
        return app.run(options);
    }
    catch (const ImageError& e) {
        std::cerr << (e.kind() == ImageError::Kind::NotFound ? "File Error: " : "Image Error: ") << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
