#pragma once

// =============================================================================
// Parzen - Adjacency Windowing
// =============================================================================
//
// Slides a three-slot window (left, middle, right) over an ascending sequence,
// including the partial windows at both ends:
//
//   [1, 2, 3] -> Right(1), MiddleRight(1,2), Full(1,2,3), LeftMiddle(2,3), Left(3)
//
// Every element passes through the middle slot exactly once, which is where
// the adaptive bandwidth of its kernel is derived from its neighbours.
//

#include <cstdint>
#include <iterator>
#include <optional>
#include <utility>

namespace parzen {

// =============================================================================
// Triple
// =============================================================================

enum class TripleKind : uint8_t {
    kRight,        // (-, -, r)
    kMiddleRight,  // (-, m, r)
    kFull,         // (l, m, r)
    kLeftMiddle,   // (l, m, -)
    kLeft,         // (l, -, -)
    kMiddle,       // (-, m, -)
};

template <typename T>
struct Triple {
    std::optional<T> left;
    std::optional<T> middle;
    std::optional<T> right;

    static Triple makeRight(T r) { return {std::nullopt, std::nullopt, r}; }
    static Triple makeMiddleRight(T m, T r) { return {std::nullopt, m, r}; }
    static Triple makeFull(T l, T m, T r) { return {l, m, r}; }
    static Triple makeLeftMiddle(T l, T m) { return {l, m, std::nullopt}; }
    static Triple makeLeft(T l) { return {l, std::nullopt, std::nullopt}; }
    static Triple makeMiddle(T m) { return {std::nullopt, m, std::nullopt}; }

    [[nodiscard]] TripleKind kind() const {
        if (middle) {
            if (left && right)
                return TripleKind::kFull;
            if (left)
                return TripleKind::kLeftMiddle;
            if (right)
                return TripleKind::kMiddleRight;
            return TripleKind::kMiddle;
        }
        return left ? TripleKind::kLeft : TripleKind::kRight;
    }

    /// Whether the window is centred on an element
    [[nodiscard]] bool hasCenter() const { return middle.has_value(); }

    bool operator==(const Triple&) const = default;
};

// =============================================================================
// TripleWindow
// =============================================================================

template <typename Iterator>
class TripleWindow {
  public:
    using value_type = typename std::iterator_traits<Iterator>::value_type;

    TripleWindow(Iterator begin, Iterator end) : current_(begin), end_(end) {}

    /// Next window, or std::nullopt once the sequence has been passed
    [[nodiscard]] std::optional<Triple<value_type>> next() {
        window_.left = std::exchange(window_.middle, window_.right);
        if (current_ != end_) {
            window_.right = *current_;
            ++current_;
        } else {
            window_.right.reset();
        }

        if (!window_.left && !window_.middle && !window_.right) {
            return std::nullopt;
        }
        return window_;
    }

  private:
    Iterator current_;
    Iterator end_;
    Triple<value_type> window_;
};

/// Window over any range exposing begin()/end(). The range must outlive the window.
template <typename Range>
[[nodiscard]] auto makeTripleWindow(const Range& range) {
    return TripleWindow<decltype(std::begin(range))>(std::begin(range), std::end(range));
}

}  // namespace parzen
