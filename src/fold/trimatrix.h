#pragma once

#include <vector>
#include <cstddef>

template <typename T>
class RangedVector
{
    public:
        RangedVector() : data_(), start_(0), end_(0) {}

        RangedVector(int start, int end, T v = T())
            : data_(end-start, v), start_(start), end_(end) {}

        void resize(int start, int end, T v = T())
        {
            data_.assign(end-start, v);
            start_ = start;
            end_ = end;
        }

        void clear()
        {
            data_.clear();
        }

        bool contains(int idx) const { return start_ <= idx && idx < end_; }

        T& operator[](int idx)
        {
            return data_[idx-start_];
        }

        const T& operator[](int idx) const
        {
            return data_[idx-start_];
        }

    private:
        std::vector<T> data_;
        int start_;
        int end_;
};

// Upper triangular matrix; row i holds columns i..sz-1.
// at(i, j) reads the empty interval (j < i) and anything outside the
// triangle as the default value.
template <typename T>
class TriMatrix
{
    public:
        TriMatrix() : data_(), empty_() {}

        TriMatrix(int sz, T v = T(), T empty = T()) : data_(sz), empty_(empty)
        {
            for (auto i=0; i!=sz; ++i)
                data_[i] = RangedVector<T>(i, sz, v);
        }

        void resize(int sz, T v = T(), T empty = T())
        {
            data_.resize(sz);
            for (auto i=0; i!=sz; ++i)
                data_[i].resize(i, sz, v);
            empty_ = empty;
        }

        void clear()
        {
            data_.clear();
        }

        size_t size() const { return data_.size(); }

        const T& at(int i, int j) const
        {
            if (i < 0 || j < 0 || i >= static_cast<int>(data_.size()) || !data_[i].contains(j))
                return empty_;
            return data_[i][j];
        }

        RangedVector<T>& operator[](size_t idx) { return data_[idx]; }
        const RangedVector<T>& operator[](size_t idx) const { return data_[idx]; }

    private:
        std::vector< RangedVector<T> > data_;
        T empty_;
};
