#include "RestrictionMap.h"

#include "FoxSheafErrors.h"

#include <sstream>
#include <utility>

namespace foxsheaf {

RestrictionMap RestrictionMap::general(int input_dimension, int output_dimension, Function fn,
                                       std::string label) {
    if (input_dimension < 1 || output_dimension < 1) {
        throw DomainError("general map '" + label + "' needs positive dimensions");
    }
    if (!fn) {
        throw DomainError("general map '" + label + "' has no function");
    }
    RestrictionMap m;
    m.kind_ = Kind::General;
    m.input_dimension_ = input_dimension;
    m.output_dimension_ = output_dimension;
    m.label_ = std::move(label);
    m.fn_ = std::move(fn);
    return m;
}

RestrictionMap RestrictionMap::linear(const Matrix& matrix, std::string label) {
    if (matrix.rows() < 1 || matrix.cols() < 1) {
        throw DomainError("linear map '" + label + "' has an empty matrix");
    }
    if (!matrix.allFinite()) {
        throw DomainError("linear map '" + label + "' has non-finite entries");
    }
    RestrictionMap m;
    m.kind_ = Kind::Linear;
    m.input_dimension_ = static_cast<int>(matrix.cols());
    m.output_dimension_ = static_cast<int>(matrix.rows());
    m.label_ = std::move(label);
    m.matrix_ = matrix;
    return m;
}

RestrictionMap RestrictionMap::identity(int dimension) {
    return linear(Matrix::Identity(dimension, dimension), "identity");
}

RestrictionMap RestrictionMap::projection(int input_dimension, const std::vector<int>& indices) {
    if (input_dimension < 1 || indices.empty()) {
        throw DomainError("projection needs a non-empty index list");
    }
    Matrix p = Matrix::Zero(static_cast<Eigen::Index>(indices.size()), input_dimension);
    for (std::size_t r = 0; r < indices.size(); ++r) {
        const int c = indices[r];
        if (c < 0 || c >= input_dimension) {
            throw DomainError("projection index " + std::to_string(c) + " out of range");
        }
        p(static_cast<Eigen::Index>(r), c) = 1.0;
    }
    return linear(p, "projection");
}

RestrictionMap RestrictionMap::compose(const RestrictionMap& outer, const RestrictionMap& inner) {
    if (outer.input_dimension_ != inner.output_dimension_) {
        std::ostringstream msg;
        msg << "cannot compose '" << outer.label_ << "' (input " << outer.input_dimension_
            << ") after '" << inner.label_ << "' (output " << inner.output_dimension_ << ")";
        throw DomainError(msg.str());
    }

    const std::string label = outer.label_ + "*" + inner.label_;
    if (outer.isLinear() && inner.isLinear()) {
        return linear(outer.matrix_ * inner.matrix_, label);
    }

    // Copies keep the composite valid independently of the operands' lifetimes.
    RestrictionMap o = outer;
    RestrictionMap i = inner;
    return general(inner.input_dimension_, outer.output_dimension_,
                   [o, i](const Vector& x) { return o.evaluate(i.evaluate(x)); },
                   label);
}

Vector RestrictionMap::evaluate(const Vector& value) const {
    if (input_dimension_ < 1) {
        throw DomainError("evaluate on an empty restriction map");
    }
    if (value.size() != input_dimension_) {
        std::ostringstream msg;
        msg << "map '" << label_ << "' expects an input of size " << input_dimension_
            << ", got " << value.size();
        throw DomainError(msg.str());
    }

    if (kind_ == Kind::Linear) {
        return matrix_ * value;
    }

    Vector out = fn_(value);
    if (out.size() != output_dimension_) {
        std::ostringstream msg;
        msg << "map '" << label_ << "' returned size " << out.size()
            << ", declared " << output_dimension_;
        throw DomainError(msg.str());
    }
    if (!out.allFinite()) {
        throw DomainError("map '" + label_ + "' returned a non-finite value");
    }
    return out;
}

} // namespace foxsheaf
