#ifndef VALNOISE_SEED_H
#define VALNOISE_SEED_H

#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>
#include <vector>

namespace valnoise {

/**
 * @class Seed
 * @brief Optional seed value for a random source
 *
 * A seed is either absent (the source draws OS entropy) or one of text,
 * raw bytes, an integer or a floating-point value. Every present seed expands
 * into a fixed word sequence for std::seed_seq, with the kind folded in so
 * that "1" and 1 seed differently.
 */
class Seed {
public:
    enum class Kind { kNone, kText, kBytes, kInteger, kFloating };

    // Absent seed
    Seed() = default;

    Seed(const char* text) : Seed(std::string(text)) {}

    Seed(const std::string& text)
        : kind_(Kind::kText), bytes_(text.begin(), text.end()) {}

    Seed(const std::vector<std::uint8_t>& bytes)
        : kind_(Kind::kBytes), bytes_(bytes) {}

    template <typename T,
              typename std::enable_if<std::is_integral<T>::value, int>::type = 0>
    Seed(T value) : kind_(Kind::kInteger) {
        if (value < T(0)) {
            negative_ = true;
            // two's complement negation stays defined for the minimum value
            magnitude_ = ~static_cast<std::uint64_t>(value) + 1u;
        } else {
            magnitude_ = static_cast<std::uint64_t>(value);
        }
    }

    template <typename T,
              typename std::enable_if<std::is_floating_point<T>::value, int>::type = 0>
    Seed(T value) : kind_(Kind::kFloating), floating_(static_cast<double>(value)) {
        if (floating_ == 0.0) {
            floating_ = 0.0; // fold -0.0 into +0.0
        }
    }

    Kind kind() const { return kind_; }
    bool isSet() const { return kind_ != Kind::kNone; }

    // Word sequence fed to std::seed_seq; empty for an absent seed
    std::vector<std::uint32_t> words() const {
        std::vector<std::uint32_t> out;
        if (kind_ == Kind::kNone) {
            return out;
        }
        out.push_back(static_cast<std::uint32_t>(kind_));

        switch (kind_) {
            case Kind::kText:
            case Kind::kBytes: {
                const std::uint64_t length = bytes_.size();
                appendU64(out, length);
                // pack bytes little-endian, 4 per word
                for (std::size_t i = 0; i < bytes_.size(); i += 4) {
                    std::uint32_t word = 0;
                    for (std::size_t b = 0; b < 4 && i + b < bytes_.size(); ++b) {
                        word |= static_cast<std::uint32_t>(bytes_[i + b]) << (8 * b);
                    }
                    out.push_back(word);
                }
                break;
            }
            case Kind::kInteger:
                out.push_back(negative_ ? 1u : 0u);
                appendU64(out, magnitude_);
                break;
            case Kind::kFloating: {
                std::uint64_t bits = 0;
                static_assert(sizeof(bits) == sizeof(floating_), "double must be 64-bit");
                std::memcpy(&bits, &floating_, sizeof(bits));
                appendU64(out, bits);
                break;
            }
            case Kind::kNone:
                break;
        }
        return out;
    }

    bool operator==(const Seed& other) const { return words() == other.words(); }
    bool operator!=(const Seed& other) const { return !(*this == other); }

private:
    static void appendU64(std::vector<std::uint32_t>& out, std::uint64_t value) {
        out.push_back(static_cast<std::uint32_t>(value & 0xFFFFFFFFu));
        out.push_back(static_cast<std::uint32_t>(value >> 32));
    }

    Kind kind_{Kind::kNone};
    std::vector<std::uint8_t> bytes_;
    std::uint64_t magnitude_{0};
    bool negative_{false};
    double floating_{0.0};
};

} // namespace valnoise

#endif // VALNOISE_SEED_H
