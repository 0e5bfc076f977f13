module;

#include <cstdint>
#include <string_view>
#include <expected>
#include <utility>

export module Core.Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    // 1. std::expected<T, E>  - For FALLIBLE operations where failure is expected
    //                          and the caller MUST handle it (input validation,
    //                          file I/O, parsing).
    //
    // 2. std::optional<T>    - For QUERIES where "not found" is a valid outcome,
    //                          or for repair passes with nothing to operate on.
    //
    // 3. Status enums        - For ROUTINE geometric fallbacks (an unclosable
    //                          loop, an exhausted ear search). These are carried
    //                          in result structs next to the payload and are
    //                          never reported as errors.
    //
    // 4. Assertions          - For INVARIANTS that should never be violated.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // I/O errors (200-299)
        FileNotFound = 200,
        FileReadError = 201,
        FileWriteError = 202,
        InvalidPath = 203,

        // Validation errors (300-399)
        InvalidArgument = 300,
        InvalidState = 301,
        InvalidFormat = 302,
        OutOfRange = 303,
        EmptyMesh = 304,

        // Geometry errors (700-799)
        DegenerateGeometry = 700,
        NonManifoldInput = 701,

        Unknown = 999
    };

    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:            return "Success";
            case ErrorCode::FileNotFound:       return "FileNotFound";
            case ErrorCode::FileReadError:      return "FileReadError";
            case ErrorCode::FileWriteError:     return "FileWriteError";
            case ErrorCode::InvalidPath:        return "InvalidPath";
            case ErrorCode::InvalidArgument:    return "InvalidArgument";
            case ErrorCode::InvalidState:       return "InvalidState";
            case ErrorCode::InvalidFormat:      return "InvalidFormat";
            case ErrorCode::OutOfRange:         return "OutOfRange";
            case ErrorCode::EmptyMesh:          return "EmptyMesh";
            case ErrorCode::DegenerateGeometry: return "DegenerateGeometry";
            case ErrorCode::NonManifoldInput:   return "NonManifoldInput";
            default:                            return "Unknown";
        }
    }

    template<typename T>
    using Expected = std::expected<T, ErrorCode>;

    template<typename T>
    constexpr Expected<T> Ok(T&& value)
    {
        return Expected<T>(std::forward<T>(value));
    }

    template<typename T>
    constexpr Expected<T> Err(ErrorCode code)
    {
        return std::unexpected(code);
    }

    // Void success type for operations that don't return a value
    struct Unit {};
    constexpr Unit unit{};

    using Result = Expected<Unit>;

    constexpr Result Ok()
    {
        return Result(unit);
    }

    constexpr Result Err(ErrorCode code)
    {
        return std::unexpected(code);
    }
}
