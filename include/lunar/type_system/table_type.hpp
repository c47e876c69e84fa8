#pragma once

#include "lunar/handle.hpp"
#include "lunar/type_system/type_base.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace lunar {

enum class NextStatus : std::uint8_t {
    Found,
    Last,
    NotFound
};

struct NextEntry {
    NextStatus status{NextStatus::Last};
    Value key;
    Value value;
};

// Hybrid array/hash map. Keys 1..n live in the array part, everything else
// in the hash part. Removing a hash entry leaves a nil tombstone so that
// iteration with next() survives deletions; tombstones are only purged when
// a new key is inserted.
class TableObject : public Object {
public:
    explicit TableObject(std::size_t arrayHint = 0, std::size_t hashHint = 0);

    const Type& getType() const override;
    void trace(Heap& heap) const override;

    // Raw access; metatables are never consulted.
    Value get(const Value& key) const;
    Value get(std::int64_t index) const;
    // Assigning nil removes the key. Throws InvalidTableKey on nil or NaN keys.
    void set(Heap& heap, const Value& key, const Value& value);

    // A border: t[n] ~= nil and t[n + 1] == nil, or 0 when t[1] is nil.
    std::int64_t length() const;

    NextEntry next(const Value& key) const;

    Handle<TableObject> metatable() const { return metatable_; }
    void setMetatable(Heap& heap, Handle<TableObject> metatable);

    std::size_t arraySize() const { return array_.size(); }
    std::size_t hashSize() const { return hash_.size() - tombstones_; }

private:
    using HashPart = std::unordered_map<Value, Value, ValueKeyHash, ValueKeyEqual>;

    static Value normalizeKey(const Value& key);
    static bool arrayIndex(const Value& key, std::size_t size, std::size_t& index);
    void appendToArray(const Value& value);
    void purgeTombstones();
    bool hashHas(std::int64_t index) const;
    NextEntry firstHashEntry(HashPart::const_iterator from) const;

    std::vector<Value> array_;
    HashPart hash_;
    std::size_t tombstones_{0};
    Handle<TableObject> metatable_;
};

class TableType : public Type {
public:
    static const TableType& instance();
    const char* name() const override;
};

} // namespace lunar
