#include "store/document_store.hpp"

namespace candlecast::store {

namespace {

// -1, 0, 1 or 2 when the values are not comparable.
int compare_values(const Json& lhs, const Json& rhs) {
    if (lhs.is_number() && rhs.is_number()) {
        const double a = lhs.get<double>();
        const double b = rhs.get<double>();
        return (a < b) ? -1 : (a > b ? 1 : 0);
    }
    if (lhs.is_string() && rhs.is_string()) {
        const int c = lhs.get_ref<const std::string&>().compare(rhs.get_ref<const std::string&>());
        return (c < 0) ? -1 : (c > 0 ? 1 : 0);
    }
    if (lhs.is_boolean() && rhs.is_boolean()) {
        return (lhs.get<bool>() == rhs.get<bool>()) ? 0 : 2;
    }
    return 2;
}

} // namespace

bool matches_filter(const Json& body, const Filter& filter) {
    const bool present = body.is_object() && body.contains(filter.field) && !body.at(filter.field).is_null();
    switch (filter.op) {
        case FilterOp::Missing: return !present;
        case FilterOp::Present: return present;
        default: break;
    }
    if (!present) return false;
    const int c = compare_values(body.at(filter.field), filter.value);
    if (c == 2) return false;
    switch (filter.op) {
        case FilterOp::Lt: return c < 0;
        case FilterOp::Le: return c <= 0;
        case FilterOp::Gt: return c > 0;
        case FilterOp::Ge: return c >= 0;
        case FilterOp::Eq: return c == 0;
        default: return false;
    }
}

} // namespace candlecast::store
