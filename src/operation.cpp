#include <docdelta-cpp/operation.hpp>

#include <docdelta-cpp/error.hpp>

namespace docdelta_cpp {

auto kind_of(const OperationAction& action) -> OpKind {
    if (action.valueless_by_exception()) {
        throw DiffError{ErrorKind::unknown_operation, "operation has no payload"};
    }
    return static_cast<OpKind>(action.index());
}

}  // namespace docdelta_cpp
