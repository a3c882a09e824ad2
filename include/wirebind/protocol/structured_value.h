#pragma once

#include <concepts>
#include <wirebind/core/types.h>

namespace wirebind {

class ProtocolMarshaller;

/**
 * @brief Capability of a shape that can appear as a nested payload value
 *
 * When the marshaller meets a Structured binding it opens a nested object and
 * hands control to marshallSelf(), which walks the shape's own ordered
 * bindings. Recursion closes here, so the marshaller never needs to know
 * concrete shape types.
 */
class StructuredValue {
public:
    virtual ~StructuredValue() = default;

    [[nodiscard]] virtual Result<void> marshallSelf(ProtocolMarshaller& marshaller) const = 0;

    bool operator==(const StructuredValue&) const = default;

protected:
    StructuredValue() = default;
    StructuredValue(const StructuredValue&) = default;
    StructuredValue(StructuredValue&&) = default;
    StructuredValue& operator=(const StructuredValue&) = default;
    StructuredValue& operator=(StructuredValue&&) = default;
};

template <typename T>
concept StructuredShape = std::derived_from<T, StructuredValue>;

} // namespace wirebind
