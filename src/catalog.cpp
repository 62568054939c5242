#include "catalog.hpp"

#include "slicer.hpp"
#include "image_error.hpp"

#include <string>
#include <vector>
#include <fstream>
#include <algorithm>
#include <stdexcept>
#include <filesystem>

#include <zlib.h>
#include <nlohmann/json.hpp>
#include <opencv2/opencv.hpp>


std::vector<CatalogEntry> Catalog::load_meta(const std::string& json_path) {
    std::ifstream f(json_path);
    if (!f) {
        throw std::runtime_error("Failed to open JSON file: " + json_path);
    }

    std::vector<CatalogEntry> entries;

    try {
        nlohmann::json j;
        f >> j;

        for (const auto& item : j.at("puzzles")) {
            CatalogEntry entry;
            entry.name = item.at("name").get<std::string>();
            entry.artist = item.value("artist", "");
            entry.offset = item.at("offset").get<int>();
            entry.length = item.at("length").get<int>();
            entries.push_back(std::move(entry));
        }
    }
    catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid puzzle catalog " + json_path + ": " + e.what());
    }
    return entries;
}

std::vector<CatalogEntry> Catalog::scan_directory(const std::string& dir) {
    std::vector<CatalogEntry> entries;

    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return entries;
    }

    for (const auto& file : std::filesystem::directory_iterator(dir, ec)) {
        if (!file.is_regular_file() || !Slicer::is_supported(file.path().string())) {
            continue;
        }

        CatalogEntry entry;
        entry.name = file.path().stem().string();
        entry.path = file.path().string();
        entries.push_back(std::move(entry));
    }

    std::sort(entries.begin(), entries.end(), [](const CatalogEntry& a, const CatalogEntry& b) { return a.name < b.name; });
    return entries;
}

cv::Mat Catalog::load_packed_image(const std::string& dat_path, const CatalogEntry& entry) {
    std::ifstream dat(dat_path, std::ios::binary);
    if (!dat) {
        throw ImageError::not_found(dat_path);
    }

    if (entry.offset < 0 || entry.length <= 0) {
        throw ImageError(ImageError::Kind::InvalidFormat, "Bad catalog range for puzzle: " + entry.name);
    }

    dat.seekg(entry.offset);
    std::vector<uchar> compressed(entry.length);
    if (!dat.read(reinterpret_cast<char*>(compressed.data()), entry.length)) {
        throw ImageError(ImageError::Kind::InvalidFormat, "Failed to read compressed data for puzzle: " + entry.name);
    }

    // Grow the output buffer until the whole image fits
    uLongf capacity = static_cast<uLongf>(entry.length) * 20;
    std::vector<uchar> uncompressed;

    for (int attempt = 0; attempt < 3; ++attempt) {
        uncompressed.resize(capacity);
        uLongf uncompressed_size = capacity;
        int z_result = uncompress(uncompressed.data(), &uncompressed_size, compressed.data(), static_cast<uLong>(entry.length));

        if (z_result == Z_OK) {
            uncompressed.resize(uncompressed_size);
            cv::Mat image = cv::imdecode(uncompressed, cv::IMREAD_COLOR);
            if (image.empty()) {
                throw ImageError(ImageError::Kind::InvalidFormat, "Undecodable image for puzzle: " + entry.name);
            }
            return image;
        }

        if (z_result != Z_BUF_ERROR) {
            break;
        }
        capacity *= 2;
    }

    throw ImageError(ImageError::Kind::InvalidFormat, "Decompression failed for puzzle: " + entry.name);
}

cv::Mat Catalog::load_image(const std::string& dat_path, const CatalogEntry& entry) {
    if (!entry.path.empty()) {
        return Slicer::load_image(entry.path);
    }
    return load_packed_image(dat_path, entry);
}
