#pragma once
#include <stdexcept>
#include <string>

namespace axial::layout {

class LayoutError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Constraint text that was not produced by to_text() or is otherwise garbled.
class MalformedSpecError : public LayoutError {
public:
    using LayoutError::LayoutError;
};

// A resolver was asked about a child that is not registered.
class UnknownChildError : public LayoutError {
public:
    using LayoutError::LayoutError;
};

// More than one child requests the remaining space on the primary axis.
class MultipleRestError : public LayoutError {
public:
    using LayoutError::LayoutError;
};

} // namespace axial::layout
