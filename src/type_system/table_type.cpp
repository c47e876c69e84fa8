#include "lunar/type_system/table_type.hpp"
#include "lunar/heap.hpp"

#include <cmath>
#include <iterator>
#include <limits>

namespace lunar {

TableObject::TableObject(std::size_t arrayHint, std::size_t hashHint) {
    array_.reserve(arrayHint);
    hash_.reserve(hashHint);
}

const Type& TableObject::getType() const {
    return TableType::instance();
}

void TableObject::trace(Heap& heap) const {
    heap.markObject(metatable_.get());
    for (const auto& value : array_) {
        heap.markValue(value);
    }
    for (const auto& [key, value] : hash_) {
        heap.markValue(key);
        heap.markValue(value);
    }
}

Value TableObject::normalizeKey(const Value& key) {
    if (key.isNil()) {
        throw InvalidTableKey("table index is nil");
    }
    if (key.isFloat()) {
        if (std::isnan(key.number)) {
            throw InvalidTableKey("table index is NaN");
        }
        std::int64_t asInt = 0;
        if (floatToInteger(key.number, asInt)) {
            return Value::Integer(asInt);
        }
    }
    return key;
}

bool TableObject::arrayIndex(const Value& key, std::size_t size, std::size_t& index) {
    if (!key.isInteger() || key.integer < 1) {
        return false;
    }
    if (static_cast<std::uint64_t>(key.integer) > size) {
        return false;
    }
    index = static_cast<std::size_t>(key.integer - 1);
    return true;
}

Value TableObject::get(const Value& key) const {
    if (key.isNil() || (key.isFloat() && std::isnan(key.number))) {
        return Value::Nil();
    }
    const Value k = normalizeKey(key);
    std::size_t index = 0;
    if (arrayIndex(k, array_.size(), index)) {
        return array_[index];
    }
    auto it = hash_.find(k);
    if (it == hash_.end()) {
        return Value::Nil();
    }
    return it->second;
}

Value TableObject::get(std::int64_t index) const {
    return get(Value::Integer(index));
}

void TableObject::set(Heap& heap, const Value& key, const Value& value) {
    const Value k = normalizeKey(key);
    heap.writeBarrier(*this, k);
    heap.writeBarrier(*this, value);

    std::size_t index = 0;
    if (arrayIndex(k, array_.size(), index)) {
        array_[index] = value;
        return;
    }

    auto it = hash_.find(k);
    if (k.isInteger() && !value.isNil() &&
        static_cast<std::uint64_t>(k.integer) == array_.size() + 1 &&
        (it == hash_.end() || it->second.isNil())) {
        if (it != hash_.end()) {
            hash_.erase(it);
            --tombstones_;
        }
        appendToArray(value);
        return;
    }

    if (it != hash_.end()) {
        if (it->second.isNil() && !value.isNil()) {
            --tombstones_;
        } else if (!it->second.isNil() && value.isNil()) {
            ++tombstones_;
        }
        it->second = value;
        return;
    }

    if (value.isNil()) {
        return;
    }
    if (tombstones_ > 0 && tombstones_ * 2 >= hash_.size()) {
        purgeTombstones();
    }
    hash_.emplace(k, value);
}

void TableObject::appendToArray(const Value& value) {
    array_.push_back(value);
    // Pull the following integer keys out of the hash part.
    while (true) {
        auto it = hash_.find(Value::Integer(static_cast<std::int64_t>(array_.size()) + 1));
        if (it == hash_.end() || it->second.isNil()) {
            break;
        }
        array_.push_back(it->second);
        hash_.erase(it);
    }
}

void TableObject::purgeTombstones() {
    for (auto it = hash_.begin(); it != hash_.end();) {
        if (it->second.isNil()) {
            it = hash_.erase(it);
        } else {
            ++it;
        }
    }
    tombstones_ = 0;
}

bool TableObject::hashHas(std::int64_t index) const {
    auto it = hash_.find(Value::Integer(index));
    return it != hash_.end() && !it->second.isNil();
}

std::int64_t TableObject::length() const {
    const auto n = static_cast<std::int64_t>(array_.size());
    if (n > 0 && array_.back().isNil()) {
        // array_[lo - 1] is non-nil (or lo == 0), array_[hi - 1] is nil.
        std::int64_t lo = 0;
        std::int64_t hi = n;
        while (hi - lo > 1) {
            const std::int64_t mid = lo + (hi - lo) / 2;
            if (array_[static_cast<std::size_t>(mid - 1)].isNil()) {
                hi = mid;
            } else {
                lo = mid;
            }
        }
        return lo;
    }

    if (!hashHas(n + 1)) {
        return n;
    }

    std::int64_t present = n + 1;
    std::int64_t absent = present * 2;
    while (hashHas(absent)) {
        present = absent;
        if (absent > std::numeric_limits<std::int64_t>::max() / 2) {
            std::int64_t border = 1;
            while (hashHas(border + 1)) {
                ++border;
            }
            return border;
        }
        absent *= 2;
    }
    while (absent - present > 1) {
        const std::int64_t mid = present + (absent - present) / 2;
        if (hashHas(mid)) {
            present = mid;
        } else {
            absent = mid;
        }
    }
    return present;
}

NextEntry TableObject::firstHashEntry(HashPart::const_iterator from) const {
    for (auto it = from; it != hash_.end(); ++it) {
        if (!it->second.isNil()) {
            return NextEntry{NextStatus::Found, it->first, it->second};
        }
    }
    return NextEntry{NextStatus::Last, Value::Nil(), Value::Nil()};
}

NextEntry TableObject::next(const Value& key) const {
    std::size_t start = 0;
    if (!key.isNil()) {
        if (key.isFloat() && std::isnan(key.number)) {
            return NextEntry{NextStatus::NotFound, Value::Nil(), Value::Nil()};
        }
        const Value k = normalizeKey(key);
        std::size_t index = 0;
        if (arrayIndex(k, array_.size(), index)) {
            start = index + 1;
        } else {
            auto it = hash_.find(k);
            if (it == hash_.end()) {
                return NextEntry{NextStatus::NotFound, Value::Nil(), Value::Nil()};
            }
            return firstHashEntry(std::next(it));
        }
    }

    for (std::size_t i = start; i < array_.size(); ++i) {
        if (!array_[i].isNil()) {
            return NextEntry{NextStatus::Found, Value::Integer(static_cast<std::int64_t>(i) + 1), array_[i]};
        }
    }
    return firstHashEntry(hash_.begin());
}

void TableObject::setMetatable(Heap& heap, Handle<TableObject> metatable) {
    metatable_ = metatable;
    if (metatable) {
        heap.writeBarrier(*this);
    }
}

const TableType& TableType::instance() {
    static const TableType type;
    return type;
}

const char* TableType::name() const {
    return "table";
}

} // namespace lunar
