#pragma once
#include <string>
#include <utility>
namespace arisen::vault::models {
class KeyHandle {
public:
    explicit KeyHandle(std::string reference)
        : reference_(std::move(reference)) {
    }
    KeyHandle(const KeyHandle&) = default;
    KeyHandle(KeyHandle&&) noexcept = default;
    KeyHandle& operator=(const KeyHandle&) = default;
    KeyHandle& operator=(KeyHandle&&) noexcept = default;
    ~KeyHandle() = default;
    [[nodiscard]] const std::string& GetReference() const noexcept {
        return reference_;
    }
    [[nodiscard]] bool operator==(const KeyHandle& other) const noexcept {
        return reference_ == other.reference_;
    }
    [[nodiscard]] bool operator!=(const KeyHandle& other) const noexcept {
        return reference_ != other.reference_;
    }
private:
    std::string reference_;
};
}
