//
// Created by Giuseppe Francione on 11/10/25.
//

#ifndef COVERTHUMB_MIME_DETECTOR_HPP
#define COVERTHUMB_MIME_DETECTOR_HPP

#include <cstdint>
#include <span>
#include <string>

namespace coverthumb {

    /**
     * @brief Detects MIME types of in-memory buffers with libmagic.
     *
     * Uses the system magic database, loaded once per calling thread and
     * kept for the thread's lifetime. Safe to use from any thread.
     */
    class MimeDetector {
    public:
        /**
         * @brief Detect the MIME type of a buffer.
         *
         * @param data Bytes to sniff; only the leading part matters.
         * @return A MIME type (e.g., "image/jpeg"), or an empty string if
         *         libmagic cannot be initialised.
         */
        static std::string detect_buffer(std::span<const std::uint8_t> data);
    };

} // namespace coverthumb
#endif //COVERTHUMB_MIME_DETECTOR_HPP
