/// @file class.cpp
/// @brief Class creation, member lookup and instantiation.

#include "lq/object/class.hpp"

#include <vector>

#include "lq/foundation/query_logger.hpp"
#include "lq/object/object.hpp"

namespace lq::object {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::QueryError;
using foundation::QueryResult;

Class::Class(Token, std::string name, Members members, ClassRef parent)
    : name_(std::move(name)), members_(std::move(members)), parent_(std::move(parent)) {}

ClassRef Class::make(std::string name, Members members, ClassRef parent) {
    if (parent) {
        // Copy down: the child's own definitions win.
        for (const auto& [memberName, member] : parent->members_) {
            members.try_emplace(memberName, member);
        }
    }

    LQ_LOG_DEBUG(LogCategory::Object,
                 "Created class " + name +
                     (parent ? " extending " + parent->name() : std::string(" (root)")));

    return std::make_shared<const Class>(Token{}, std::move(name), std::move(members),
                                         std::move(parent));
}

bool Class::hasOwnMember(std::string_view name) const {
    return members_.find(std::string(name)) != members_.end();
}

const Value* Class::findMember(std::string_view name) const {
    const std::string key(name);
    for (const Class* cls = this; cls != nullptr; cls = cls->parent_.get()) {
        auto it = cls->members_.find(key);
        if (it != cls->members_.end()) {
            return &it->second;
        }
    }
    return nullptr;
}

bool Class::isSubclassOf(const Class& other) const noexcept {
    for (const Class* cls = this; cls != nullptr; cls = cls->parent_.get()) {
        if (cls == &other) {
            return true;
        }
    }
    return false;
}

QueryResult<ObjectRef> Class::instantiate(Arguments args) const {
    return instantiateWith(std::any(), args);
}

QueryResult<ObjectRef> Class::instantiateWith(std::any nativeState, Arguments args) const {
    auto object = std::make_shared<Object>(Object::Key{}, shared_from_this(),
                                           std::move(nativeState));

    const Value* init = findMember(kInitMember);
    if (init == nullptr) {
        return QueryResult<ObjectRef>::ok(std::move(object));
    }
    if (!init->isFunction()) {
        return QueryResult<ObjectRef>::err(
            QueryError(ErrorCode::NotCallable,
                       "init member of class " + name_ + " is not a function",
                       init->kind()));
    }

    std::vector<Value> callArgs;
    callArgs.reserve(args.size() + 1);
    callArgs.emplace_back(object);
    callArgs.insert(callArgs.end(), args.begin(), args.end());
    init->call(callArgs);

    return QueryResult<ObjectRef>::ok(std::move(object));
}

bool Class::classOf(const Value& value) const {
    if (!value.isObject()) {
        return false;
    }
    return value.asObject()->instanceOf(*this);
}

} // namespace lq::object
