/// @file object.cpp
/// @brief Object field access, method calls and membership tests.

#include "lq/object/object.hpp"

#include <vector>

namespace lq::object {

using foundation::ErrorCode;
using foundation::QueryError;
using foundation::QueryResult;

Object::Object(Key, ClassRef cls, std::any nativeState)
    : class_(std::move(cls)), native_(std::move(nativeState)) {}

bool Object::instanceOf(const Class& cls) const noexcept {
    return class_ && class_->isSubclassOf(cls);
}

Value Object::get(std::string_view name) const {
    auto it = fields_.find(std::string(name));
    if (it != fields_.end()) {
        return it->second;
    }
    const Value* member = class_->findMember(name);
    return member != nullptr ? *member : Value();
}

void Object::set(std::string_view name, Value value) {
    if (value.isNil()) {
        fields_.erase(std::string(name));
        return;
    }
    fields_.insert_or_assign(std::string(name), std::move(value));
}

QueryResult<Value> Object::call(std::string_view name, Arguments args) {
    const Value member = get(name);
    if (member.isNil()) {
        return QueryResult<Value>::err(
            QueryError(ErrorCode::MemberNotFound,
                       "no member '" + std::string(name) + "' on " + class_->name()));
    }
    if (!member.isFunction()) {
        return QueryResult<Value>::err(
            QueryError(ErrorCode::NotCallable,
                       "member '" + std::string(name) + "' of " + class_->name() +
                           " is not a function",
                       member.kind()));
    }

    std::vector<Value> callArgs;
    callArgs.reserve(args.size() + 1);
    callArgs.emplace_back(shared_from_this());
    callArgs.insert(callArgs.end(), args.begin(), args.end());
    return QueryResult<Value>::ok(member.call(callArgs));
}

} // namespace lq::object
