#ifndef TORGEN_METAINFO_ERROR_HEADER
#define TORGEN_METAINFO_ERROR_HEADER

#include "path.hpp"

#include <system_error>
#include <string>

namespace torgen {

enum class metainfo_errc
{
    // The root path handed to the builder does not exist.
    path_not_found = 1,
    // A file could not be opened or read while it was being hashed.
    read_failed,
    // A file yielded a different number of bytes than its size when the tree was
    // enumerated, i.e. it was modified while we were hashing it.
    file_size_changed,
    invalid_piece_length,
    // There is nothing to hash: an empty file or a directory without (non-empty)
    // files.
    empty_content,
    // The root path is neither a regular file nor a directory.
    unsupported_file_type,
    invalid_node_address,
    write_failed
};

inline bool operator==(const metainfo_errc e, const int i) noexcept
{
    return static_cast<int>(e) == i;
}

inline bool operator!=(const int i, const metainfo_errc e) noexcept
{
    return !(e == i);
}

struct metainfo_error_category : public std::error_category
{
    const char* name() const noexcept override { return "metainfo"; }
    std::string message(int env) const override;
    std::error_condition default_error_condition(int ev) const noexcept override;
};

const metainfo_error_category& metainfo_category();
std::error_code make_error_code(metainfo_errc e);
std::error_condition make_error_condition(metainfo_errc e);

/**
 * Thrown by the metainfo builder. file_path is the file or directory that caused the
 * error, or empty if the error concerns the arguments alone. Any OS error that caused
 * the failure is part of what().
 */
class metainfo_error : public std::system_error
{
    fs::path path_;

public:
    metainfo_error(std::error_code ec, fs::path p, const std::string& detail = "");

    const fs::path& file_path() const noexcept { return path_; }
};

} // namespace torgen

namespace std
{
    template<> struct is_error_code_enum<torgen::metainfo_errc> : public true_type {};
}

#endif // TORGEN_METAINFO_ERROR_HEADER
