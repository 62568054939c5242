#pragma once

#include <string>
#include <stdexcept>

class ImageError : public std::runtime_error {
public:
    enum class Kind {
        NotFound,
        InvalidFormat
    };

    ImageError(Kind kind, const std::string& what) : std::runtime_error(what), error_kind(kind) {}

    Kind kind() const { return error_kind; }

    static ImageError not_found(const std::string& path) {
        return ImageError(Kind::NotFound, "Image file not found: " + path);
    }

    static ImageError invalid_format(const std::string& path) {
        return ImageError(Kind::InvalidFormat, "Invalid image format: " + path);
    }

private:
    Kind error_kind;
};
