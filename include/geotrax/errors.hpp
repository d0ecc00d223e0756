#pragma once

#include <stdexcept>
#include <string>

namespace geotrax {

    /**
     * @brief Root of every error geotrax raises
     */
    class Error : public std::runtime_error {
      public:
        explicit Error(const std::string &what) : std::runtime_error(what) {}
    };

    /**
     * @brief A place name that could not be resolved to a coordinate
     */
    class NotFound : public Error {
        std::string input_;

      public:
        NotFound(const std::string &what, std::string input) : Error(what), input_(std::move(input)) {}

        /// The text that failed to resolve
        const std::string &input() const { return input_; }
    };

    /// Bad caller input: buffer size, paging, spatial predicate, geometry text
    class ValidationError : public Error {
      public:
        explicit ValidationError(const std::string &what) : Error(what) {}
    };

    /// Uploaded file is not a track file at all
    class TrackFormatError : public ValidationError {
      public:
        explicit TrackFormatError(const std::string &what) : ValidationError(what) {}
    };

    /// Track parsed but has fewer than two usable points
    class EmptyTrackError : public ValidationError {
      public:
        explicit EmptyTrackError(const std::string &what) : ValidationError(what) {}
    };

    /// Geocoding/routing provider failed or timed out
    class UpstreamUnavailable : public Error {
      public:
        explicit UpstreamUnavailable(const std::string &what) : Error(what) {}
    };

    /// Store read or write failed
    class PersistenceError : public Error {
      public:
        explicit PersistenceError(const std::string &what) : Error(what) {}
    };

    class Cancelled : public Error {
      public:
        explicit Cancelled(const std::string &what) : Error(what) {}
    };

} // namespace geotrax
