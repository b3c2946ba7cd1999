#pragma once

#include <any>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <vector>

namespace querybus {

// Readable (demangled) name of a type, for logs and error messages.
std::string type_name(std::type_index type);

// The shape a caller expects back from a query. Handlers declare the type
// they produce when they subscribe; the bus routes only to handlers whose
// declared type matches(), and convert()s their raw result into the shape.
class response_type {
public:
    virtual ~response_type() = default;

    // True if a handler producing `declared` can answer this response type.
    virtual bool matches(std::type_index declared) const = 0;

    // Convert a raw handler result. An empty `raw` is a null answer.
    // Throws std::bad_any_cast if `raw` holds an incompatible type.
    virtual std::any convert(const std::any& raw) const = 0;

    // Type held by converted responses.
    virtual std::type_index response_payload_type() const = 0;

    virtual std::string describe() const = 0;
};

// Exactly one T.
template <typename T>
class instance_response_type final : public response_type {
public:
    bool matches(std::type_index declared) const override {
        return declared == std::type_index(typeid(T));
    }

    std::any convert(const std::any& raw) const override {
        if (!raw.has_value()) return {};
        return std::any(std::any_cast<const T&>(raw));
    }

    std::type_index response_payload_type() const override { return typeid(T); }

    std::string describe() const override {
        return "instance_of<" + type_name(typeid(T)) + ">";
    }
};

// std::optional<T>; handlers may declare T or std::optional<T>.
template <typename T>
class optional_response_type final : public response_type {
public:
    bool matches(std::type_index declared) const override {
        return declared == std::type_index(typeid(T))
            || declared == std::type_index(typeid(std::optional<T>));
    }

    std::any convert(const std::any& raw) const override {
        if (!raw.has_value()) return std::optional<T>{};
        if (raw.type() == typeid(std::optional<T>)) return raw;
        return std::optional<T>(std::any_cast<const T&>(raw));
    }

    std::type_index response_payload_type() const override {
        return typeid(std::optional<T>);
    }

    std::string describe() const override {
        return "optional_of<" + type_name(typeid(T)) + ">";
    }
};

// std::vector<T>; handlers may declare std::vector<T>, or a single T which
// is answered as a one-element list.
template <typename T>
class multiple_instances_response_type final : public response_type {
public:
    bool matches(std::type_index declared) const override {
        return declared == std::type_index(typeid(std::vector<T>))
            || declared == std::type_index(typeid(T));
    }

    std::any convert(const std::any& raw) const override {
        if (!raw.has_value()) return std::vector<T>{};
        if (raw.type() == typeid(std::vector<T>)) return raw;
        return std::vector<T>{std::any_cast<const T&>(raw)};
    }

    std::type_index response_payload_type() const override {
        return typeid(std::vector<T>);
    }

    std::string describe() const override {
        return "multiple_instances_of<" + type_name(typeid(T)) + ">";
    }
};

template <typename T>
std::shared_ptr<const response_type> instance_of() {
    return std::make_shared<const instance_response_type<T>>();
}

template <typename T>
std::shared_ptr<const response_type> optional_of() {
    return std::make_shared<const optional_response_type<T>>();
}

template <typename T>
std::shared_ptr<const response_type> multiple_instances_of() {
    return std::make_shared<const multiple_instances_response_type<T>>();
}

} // namespace querybus
