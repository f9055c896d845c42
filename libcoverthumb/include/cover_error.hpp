//
// Created by Giuseppe Francione on 02/12/25.
//

/**
 * @file cover_error.hpp
 * @brief Error kinds raised while producing a thumbnail.
 */

#ifndef COVERTHUMB_COVER_ERROR_HPP
#define COVERTHUMB_COVER_ERROR_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace coverthumb {

/**
 * @brief Classifies why a thumbnail request failed.
 */
enum class ErrorKind {
    UnsupportedFormat, ///< extension not in the known set
    ContainerError,    ///< archive or database cannot be opened or parsed
    NoCoverFound,      ///< container is fine, no image satisfies any rule
    DecodeError,       ///< extracted bytes are not a decodable raster image
    IoError,           ///< read or seek failure on the source file
    CacheWriteFailure  ///< never thrown to callers, only logged and counted
};

/**
 * @brief Stable lowercase name of an ErrorKind (e.g. "no-cover-found").
 */
std::string_view to_string(ErrorKind kind) noexcept;

/**
 * @brief Exception carrying an ErrorKind.
 *
 * Every fatal failure of a thumbnail request surfaces as a CoverError.
 */
class CoverError : public std::runtime_error {
public:
    CoverError(const ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace coverthumb

#endif // COVERTHUMB_COVER_ERROR_HPP
