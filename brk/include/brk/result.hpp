#ifndef BRK_RESULT_HPP
#define BRK_RESULT_HPP

namespace brk {

/* Generic error, either success or failure. */
enum class GenericError {
    NONE,
    FAILURE
};

/*  Basic result type, VALUE should only be accessed if ERROR is NONE (or any
    equivalent). */
template <typename ValueType, typename ErrorType = GenericError>
struct Result {
    ValueType value{};
    ErrorType error{};
};

} // namespace brk

#endif
