/**
 * @file naming.cpp
 * @brief Default variable names and output paths.
 */

#include <ch8pack/naming.hpp>

namespace ch8pack {

static bool ends_with(std::string_view s, std::string_view suffix) noexcept {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

static std::string_view strip_suffix(std::string_view s, std::string_view suffix) noexcept {
    return ends_with(s, suffix) ? s.substr(0, s.size() - suffix.size()) : s;
}

std::string strip_rom_suffix(std::string_view path) {
    path = strip_suffix(path, ".ch8");
    path = strip_suffix(path, ".rom");
    return std::string(path);
}

std::string default_var_name(std::string_view input_path) {
    const std::string stripped = strip_rom_suffix(input_path);
    const auto slash = stripped.rfind('/');
    return slash == std::string::npos ? stripped : stripped.substr(slash + 1);
}

std::string package_path(std::string_view input_path, std::string_view output,
                         Calculator calculator) {
    std::string path = output.empty() ? strip_rom_suffix(input_path) : std::string(output);
    path += file_extension(calculator);
    return path;
}

std::string extracted_rom_path(std::string_view package_path) {
    for (Calculator calculator : {Calculator::TI89, Calculator::TI92Plus, Calculator::V200}) {
        if (ends_with(package_path, file_extension(calculator))) {
            return std::string(strip_suffix(package_path, file_extension(calculator))) + ".ch8";
        }
    }
    return std::string(package_path) + ".ch8";
}

} // namespace ch8pack
