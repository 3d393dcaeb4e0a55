#pragma once

#include <functional>
#include <string>
#include <vector>

#include "Stalk.h"

namespace foxsheaf {

// ============================================================
// Restriction map attached to one comparison edge.
//
// Tagged value: either a general function between stalks with
// declared input/output dimensions, or a linear map given by a
// matrix. evaluate() dispatches on the tag and never returns a
// value for an input outside its declared domain.
// ============================================================
class RestrictionMap {
public:
    enum class Kind : int {
        General = 0,
        Linear = 1,
    };

    using Function = std::function<Vector(const Vector&)>;

    RestrictionMap() = default;

    static RestrictionMap general(int input_dimension, int output_dimension, Function fn,
                                  std::string label = "general");
    static RestrictionMap linear(const Matrix& matrix, std::string label = "linear");

    static RestrictionMap identity(int dimension);
    // Selects `indices` (in order) out of an input of `input_dimension`.
    static RestrictionMap projection(int input_dimension, const std::vector<int>& indices);

    // outer(inner(x)); linear after linear stays linear.
    static RestrictionMap compose(const RestrictionMap& outer, const RestrictionMap& inner);

    Kind kind() const { return kind_; }
    bool isLinear() const { return kind_ == Kind::Linear; }
    int inputDimension() const { return input_dimension_; }
    int outputDimension() const { return output_dimension_; }
    const std::string& label() const { return label_; }

    // Only meaningful for linear maps.
    const Matrix& matrix() const { return matrix_; }

    Vector evaluate(const Vector& value) const;

private:
    Kind kind_ = Kind::General;
    int input_dimension_ = 0;
    int output_dimension_ = 0;
    std::string label_;
    Function fn_;
    Matrix matrix_;
};

} // namespace foxsheaf
