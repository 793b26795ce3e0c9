#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <vector>

/**
 * @file field_array.hpp
 * @brief Contiguous per-layer, per-point field storage.
 *
 * Stores values row-major as `[layer][point]` (rank 2) or
 * `[layer][point][component]` (rank 3). Scalar fields use rank 2;
 * vector and composition-histogram fields use rank 3.
 */

namespace terra
{

using ValueType = float;

class FieldArray
{
public:
    /**
     * @brief Constructs an empty rank-2 array.
     */
    FieldArray() : nlayers_(0), npts_(0), ncomp_(1), rank_(2) {}

    /**
     * @brief Constructs a zero-initialized rank-2 array.
     * @param nlayers Layer dimension.
     * @param npts Lateral point dimension.
     */
    FieldArray(int nlayers, int npts) : nlayers_(nlayers), npts_(npts), ncomp_(1), rank_(2)
    {
        data_.resize(checked_size(nlayers, npts, 1), 0.0f);
    }

    /**
     * @brief Constructs a zero-initialized rank-3 array.
     * @param nlayers Layer dimension.
     * @param npts Lateral point dimension.
     * @param ncomp Component dimension.
     */
    FieldArray(int nlayers, int npts, int ncomp)
        : nlayers_(nlayers), npts_(npts), ncomp_(ncomp), rank_(3)
    {
        data_.resize(checked_size(nlayers, npts, ncomp), 0.0f);
    }

    /**
     * @brief Copies a nested `[layer][point]` table into a rank-2 array.
     */
    static FieldArray from_nested(const std::vector<std::vector<ValueType>>& nested)
    {
        const int nlayers = static_cast<int>(nested.size());
        const int npts = nested.empty() ? 0 : static_cast<int>(nested[0].size());
        FieldArray out(nlayers, npts);
        for (int i = 0; i < nlayers; ++i)
        {
            if (static_cast<int>(nested[i].size()) != npts)
            {
                throw std::invalid_argument("FieldArray::from_nested ragged point dimension");
            }
            if (npts > 0)
            {
                std::copy(nested[i].begin(), nested[i].end(), out.data_.begin() + out.flatten_index(i, 0, 0));
            }
        }
        return out;
    }

    /**
     * @brief Copies a nested `[layer][point][component]` table into a rank-3 array.
     */
    static FieldArray from_nested(const std::vector<std::vector<std::vector<ValueType>>>& nested)
    {
        const int nlayers = static_cast<int>(nested.size());
        const int npts = nested.empty() ? 0 : static_cast<int>(nested[0].size());
        const int ncomp = (npts == 0) ? 0 : static_cast<int>(nested[0][0].size());
        FieldArray out(nlayers, npts, ncomp);
        for (int i = 0; i < nlayers; ++i)
        {
            if (static_cast<int>(nested[i].size()) != npts)
            {
                throw std::invalid_argument("FieldArray::from_nested ragged point dimension");
            }
            for (int j = 0; j < npts; ++j)
            {
                if (static_cast<int>(nested[i][j].size()) != ncomp)
                {
                    throw std::invalid_argument("FieldArray::from_nested ragged component dimension");
                }
                if (ncomp > 0)
                {
                    std::copy(nested[i][j].begin(), nested[i][j].end(),
                              out.data_.begin() + out.flatten_index(i, j, 0));
                }
            }
        }
        return out;
    }

    /**
     * @brief Fills all elements with a constant value.
     */
    void fill(ValueType value) { std::fill(data_.begin(), data_.end(), value); }

    int rank() const { return rank_; }
    int nlayers() const { return nlayers_; }
    int npts() const { return npts_; }

    /**
     * @brief Returns the component count (1 for rank-2 arrays).
     */
    int ncomp() const { return ncomp_; }

    /**
     * @brief Returns the shape as a list of `rank()` extents.
     */
    std::vector<int> shape() const
    {
        if (rank_ == 2)
        {
            return {nlayers_, npts_};
        }
        return {nlayers_, npts_, ncomp_};
    }

    size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    ValueType* data() { return data_.data(); }
    const ValueType* data() const { return data_.data(); }

    /**
     * @brief Element access for rank-2 arrays, or component 0 of rank-3 arrays.
     */
    ValueType& operator()(int layer, int point) { return data_[flatten_index(layer, point, 0)]; }
    const ValueType& operator()(int layer, int point) const { return data_[flatten_index(layer, point, 0)]; }

    ValueType& operator()(int layer, int point, int comp) { return data_[flatten_index(layer, point, comp)]; }

    const ValueType& operator()(int layer, int point, int comp) const
    {
        return data_[flatten_index(layer, point, comp)];
    }

    /**
     * @brief Pointer to the `ncomp()` contiguous values at one (layer, point).
     */
    const ValueType* values_at(int layer, int point) const { return data_.data() + flatten_index(layer, point, 0); }

private:
    size_t flatten_index(int layer, int point, int comp) const
    {
        assert(layer >= 0 && layer < nlayers_ && point >= 0 && point < npts_ && comp >= 0 && comp < ncomp_);
        // Row-major: idx = (layer*npts + point)*ncomp + comp.
        return (static_cast<size_t>(layer) * static_cast<size_t>(npts_) + static_cast<size_t>(point)) *
                   static_cast<size_t>(ncomp_) +
               static_cast<size_t>(comp);
    }

    static size_t checked_size(int nlayers, int npts, int ncomp)
    {
        if (nlayers < 0 || npts < 0 || ncomp < 0)
        {
            throw std::invalid_argument("FieldArray dimensions must be non-negative");
        }

        const size_t nl_sz = static_cast<size_t>(nlayers);
        const size_t np_sz = static_cast<size_t>(npts);
        const size_t nc_sz = static_cast<size_t>(ncomp);

        if (nl_sz != 0 && np_sz > std::numeric_limits<size_t>::max() / nl_sz)
        {
            throw std::overflow_error("FieldArray size overflow on nlayers*npts");
        }

        const size_t nl_np = nl_sz * np_sz;
        if (nl_np != 0 && nc_sz > std::numeric_limits<size_t>::max() / nl_np)
        {
            throw std::overflow_error("FieldArray size overflow on nlayers*npts*ncomp");
        }

        return nl_np * nc_sz;
    }

    int nlayers_;
    int npts_;
    int ncomp_;
    int rank_;
    std::vector<ValueType> data_;
};

} // namespace terra
