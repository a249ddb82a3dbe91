#ifndef STRATA_COMMON_SHAPE_HPP
#define STRATA_COMMON_SHAPE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <torch/torch.h>

#include "error.hpp"

namespace Strata {
    // A dimension is either a known positive extent or unknown (deferred).
    using Dim = std::optional<std::int64_t>;
    using Shape = std::vector<Dim>;

    inline constexpr std::nullopt_t Unknown = std::nullopt;

    [[nodiscard]] inline bool is_complete(const Shape& shape) noexcept
    {
        for (const auto& dim : shape) {
            if (!dim.has_value()) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] inline Shape to_shape(const std::vector<std::int64_t>& sizes)
    {
        return Shape(sizes.begin(), sizes.end());
    }

    [[nodiscard]] inline std::string format_shape(const Shape& shape)
    {
        std::ostringstream stream;
        stream << '(';
        for (std::size_t index = 0; index < shape.size(); ++index) {
            if (index > 0) {
                stream << ", ";
            }
            if (shape[index]) {
                stream << *shape[index];
            } else {
                stream << '?';
            }
        }
        if (shape.size() == 1) {
            stream << ',';
        }
        stream << ')';
        return stream.str();
    }

    [[nodiscard]] inline std::string format_sizes(const std::vector<std::int64_t>& sizes)
    {
        return format_shape(to_shape(sizes));
    }

    [[nodiscard]] inline std::vector<std::int64_t> to_sizes(const Shape& shape)
    {
        std::vector<std::int64_t> sizes;
        sizes.reserve(shape.size());
        for (const auto& dim : shape) {
            if (!dim) {
                throw Error::InferenceError("Shape " + format_shape(shape) + " still has unknown dimensions.");
            }
            sizes.push_back(*dim);
        }
        return sizes;
    }

    // Total compatibility check: ranks must agree, two known extents must be
    // equal, a known extent wins over an unknown one. Returns the refined
    // shape, or nothing when the two cannot describe the same tensor.
    [[nodiscard]] inline std::optional<Shape> merge_shapes(const Shape& lhs, const Shape& rhs)
    {
        if (lhs.size() != rhs.size()) {
            return std::nullopt;
        }

        Shape merged(lhs.size());
        for (std::size_t index = 0; index < lhs.size(); ++index) {
            const auto& a = lhs[index];
            const auto& b = rhs[index];
            if (a && b) {
                if (*a != *b) {
                    return std::nullopt;
                }
                merged[index] = a;
            } else {
                merged[index] = a ? a : b;
            }
        }
        return merged;
    }

    // Fills the unknown dimensions of `declared` from a concrete observation.
    [[nodiscard]] inline Shape resolve_shape(const Shape& declared,
                                             const std::vector<std::int64_t>& observed,
                                             std::string_view label)
    {
        if (declared.size() != observed.size()) {
            throw Error::InferenceError(
                "Cannot infer shape of '" + std::string(label) + "': declared " + format_shape(declared)
                + " has rank " + std::to_string(declared.size()) + " but the input supplies "
                + format_sizes(observed) + ".");
        }

        Shape resolved(declared.size());
        for (std::size_t index = 0; index < declared.size(); ++index) {
            const auto& dim = declared[index];
            const auto seen = observed[index];
            if (dim) {
                if (*dim != seen) {
                    throw Error::ShapeConflict(
                        "Shape of '" + std::string(label) + "' is fixed to " + format_shape(declared)
                        + " and cannot accept " + format_sizes(observed) + ".");
                }
                resolved[index] = dim;
                continue;
            }
            if (seen <= 0) {
                throw Error::InferenceError(
                    "Cannot infer dimension " + std::to_string(index) + " of '" + std::string(label)
                    + "' from " + format_sizes(observed) + ".");
            }
            resolved[index] = seen;
        }
        return resolved;
    }

    [[nodiscard]] inline std::string scalar_type_name(torch::ScalarType type)
    {
        switch (type) {
            case torch::kByte: return "uint8";
            case torch::kChar: return "int8";
            case torch::kShort: return "int16";
            case torch::kInt: return "int32";
            case torch::kLong: return "int64";
            case torch::kHalf: return "float16";
            case torch::kFloat: return "float32";
            case torch::kDouble: return "float64";
            case torch::kBool: return "bool";
            case torch::kBFloat16: return "bfloat16";
            default: return std::to_string(static_cast<int>(type));
        }
    }

    [[nodiscard]] inline bool is_integral_type(torch::ScalarType type) noexcept
    {
        return c10::isIntegralType(type, /*includeBool=*/false);
    }

    // Input identity used to key a cached graph.
    struct TensorSignature {
        torch::Device device{torch::kCPU};
        torch::ScalarType dtype{torch::kFloat32};
        std::vector<std::int64_t> shape{};

        [[nodiscard]] std::int64_t rank() const noexcept { return static_cast<std::int64_t>(shape.size()); }

        friend bool operator==(const TensorSignature& lhs, const TensorSignature& rhs)
        {
            return lhs.device == rhs.device && lhs.dtype == rhs.dtype && lhs.shape == rhs.shape;
        }

        friend bool operator!=(const TensorSignature& lhs, const TensorSignature& rhs) { return !(lhs == rhs); }
    };

    [[nodiscard]] inline std::vector<std::int64_t> tensor_sizes(const torch::Tensor& tensor)
    {
        const auto sizes = tensor.sizes();
        return std::vector<std::int64_t>(sizes.begin(), sizes.end());
    }

    [[nodiscard]] inline TensorSignature describe_tensor(const torch::Tensor& tensor)
    {
        if (!tensor.defined()) {
            throw std::invalid_argument("Cannot describe an undefined tensor.");
        }
        TensorSignature signature{};
        signature.device = tensor.device();
        signature.dtype = tensor.scalar_type();
        signature.shape = tensor_sizes(tensor);
        return signature;
    }

    [[nodiscard]] inline std::string format_signature(const TensorSignature& signature)
    {
        std::ostringstream stream;
        stream << "shape=" << format_sizes(signature.shape)
               << ", dtype=" << scalar_type_name(signature.dtype)
               << ", device=" << signature.device.str();
        return stream.str();
    }
}

#endif // STRATA_COMMON_SHAPE_HPP
