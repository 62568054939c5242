#pragma once

#include "main.hpp"

#include <string>
#include <vector>

#include <opencv2/opencv.hpp>


class Catalog {
public:
    static std::vector<CatalogEntry> load_meta(const std::string& json_path);
    static std::vector<CatalogEntry> scan_directory(const std::string& dir);

    static cv::Mat load_packed_image(const std::string& dat_path, const CatalogEntry& entry);

    // Loose files go through the regular loader, packed ones through the data file
    static cv::Mat load_image(const std::string& dat_path, const CatalogEntry& entry);
};
