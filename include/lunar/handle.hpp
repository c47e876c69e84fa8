#pragma once

#include <functional>
#include <stdexcept>
#include <type_traits>

namespace lunar {

// Handle is a non-owning typed reference to an object owned by the Heap.
// It stays valid until the collector proves the object unreachable.
template <typename T>
class Handle {
public:
    Handle() = default;
    explicit Handle(T* object) : object_(object) {}

    template <typename U, typename = std::enable_if_t<std::is_convertible_v<U*, T*>>>
    Handle(const Handle<U>& other) : object_(other.get()) {}

    T* get() const { return object_; }

    T* operator->() const {
        if (!object_) {
            throw std::runtime_error("Dereferencing an empty handle");
        }
        return object_;
    }

    T& operator*() const { return *operator->(); }

    explicit operator bool() const { return object_ != nullptr; }

    bool operator==(const Handle& other) const { return object_ == other.object_; }
    bool operator!=(const Handle& other) const { return object_ != other.object_; }

private:
    T* object_{nullptr};
};

} // namespace lunar

template <typename T>
struct std::hash<lunar::Handle<T>> {
    std::size_t operator()(const lunar::Handle<T>& handle) const noexcept {
        return std::hash<T*>{}(handle.get());
    }
};
