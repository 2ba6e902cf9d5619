#include "brk/file_utils.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <system_error>

namespace brk {

std::optional<std::string>
get_file_content(const std::filesystem::path &path) {
    std::ifstream file(path);
    if (!file.good())
        return std::nullopt;

    std::stringstream ss;
    ss << file.rdbuf();
    if (file.bad())
        return std::nullopt;

    return ss.str();
}

bool write_file_content(const std::filesystem::path &path,
                        const std::string &content) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            fprintf(stderr, "Could not create directory %s: %s\n",
                    path.parent_path().string().c_str(), ec.message().c_str());
            return false;
        }
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.good())
        return false;

    file << content;
    file.flush();

    return file.good();
}

} // namespace brk
