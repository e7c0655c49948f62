#pragma once

#include <filesystem>
#include <fstream>
#include <string>

#include "sedfuse/CatalogTable.hpp"
#include "sedfuse/Source.hpp"

namespace sedfuse {

// 3C 273 as the batch would build it from an input line.
inline Source QuasarSource(double ra = 187.27792, double dec = 2.05239, double z = 0.158) {
    return Source(1, "3C 273", "", SkyPosition{ra, dec}, z);
}

// Fresh scratch directory under the system temp dir, removed on destruction.
class ScratchDir {
public:
    explicit ScratchDir(const std::string &name)
        : path_(std::filesystem::temp_directory_path() / ("sedfuse-test-" + name)) {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path &Path() const { return path_; }

    std::string Write(const std::string &relative, const std::string &content) const {
        const auto p = path_ / relative;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream(p) << content;
        return p.string();
    }

private:
    std::filesystem::path path_;
};

// arcsec → degrees
inline double Arcsec(double a) {
    return a / 3600.0;
}

} // namespace sedfuse
