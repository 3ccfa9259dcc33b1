#pragma once

#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>

namespace griffine {

    /// Base exception for all griffine errors
    class griffine_error : public std::runtime_error {
      public:
        explicit griffine_error(const std::string &message) : std::runtime_error(message) {}
    };

    /// Exception for a column, row or point outside the addressable extent of a grid
    class out_of_bounds_error : public griffine_error {
      public:
        /// Integral index, reported exactly in the message
        out_of_bounds_error(const std::string &axis, std::size_t index, std::size_t extent)
            : griffine_error(format_message(axis, std::to_string(index), extent)), axis_(axis),
              index_(static_cast<double>(index)), extent_(extent) {}

        /// Fractional grid coordinate, from a point lookup
        out_of_bounds_error(const std::string &axis, double index, std::size_t extent)
            : griffine_error(format_message(axis, format_index(index), extent)), axis_(axis), index_(index),
              extent_(extent) {}

        const std::string &axis() const { return axis_; }
        /// Rounded to double for integral indices above 2^53; what() keeps the exact value
        double index() const { return index_; }
        std::size_t extent() const { return extent_; }

      private:
        std::string axis_;
        double index_;
        std::size_t extent_;

        static std::string format_index(double index) {
            std::ostringstream oss;
            oss << index;
            return oss.str();
        }

        static std::string format_message(const std::string &axis, const std::string &index, std::size_t extent) {
            std::ostringstream oss;
            oss << axis << " " << index << " outside grid extent [0, " << extent << ")";
            return oss.str();
        }
    };

    /// Exception for invalid grid sizes and tiling parameters
    class configuration_error : public griffine_error {
      public:
        configuration_error(const std::string &field, const std::string &expected, const std::string &actual)
            : griffine_error(format_message(field, expected, actual)), field_(field), expected_(expected),
              actual_(actual) {}

        const std::string &field() const { return field_; }
        const std::string &expected() const { return expected_; }
        const std::string &actual() const { return actual_; }

      private:
        std::string field_;
        std::string expected_;
        std::string actual_;

        static std::string format_message(const std::string &field, const std::string &expected,
                                          const std::string &actual) {
            std::ostringstream oss;
            oss << "Invalid " << field << ": expected " << expected << ", got " << actual;
            return oss.str();
        }
    };

    /// Exception for an inverse mapping requested from a non-invertible transform
    class degenerate_transform_error : public griffine_error {
      public:
        explicit degenerate_transform_error(double determinant)
            : griffine_error(format_message(determinant)), determinant_(determinant) {}

        double determinant() const { return determinant_; }

      private:
        double determinant_;

        static std::string format_message(double determinant) {
            std::ostringstream oss;
            oss << "Transform is not invertible (determinant " << determinant << ")";
            return oss.str();
        }
    };

} // namespace griffine
