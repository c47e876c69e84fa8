#pragma once

#include "lunar/type_system/type_base.hpp"

#include <cstddef>
#include <string>

namespace lunar {

// Immutable byte string. Created only through Heap::intern, so two string
// objects with equal contents never coexist in one heap.
class StringObject : public Object {
public:
    explicit StringObject(std::string text);

    const Type& getType() const override;
    const std::string& text() const { return text_; }
    std::size_t hash() const { return hash_; }
    std::size_t size() const { return text_.size(); }

private:
    std::string text_;
    std::size_t hash_;
};

class StringType : public Type {
public:
    static const StringType& instance();
    const char* name() const override;
    std::string __str__(const Object& self) const override;
};

} // namespace lunar
