#ifndef BRK_FILE_UTILS_HPP
#define BRK_FILE_UTILS_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace brk {

[[nodiscard]] std::optional<std::string>
get_file_content(const std::filesystem::path &path);

/* Creates missing parent directories, then overwrites PATH. */
[[nodiscard]] bool write_file_content(const std::filesystem::path &path,
                                      const std::string &content);

} // namespace brk

#endif
