#include <mintex/protocol/operations.hpp>

#include <fc/variant.hpp>

#include <map>

namespace mintex { namespace protocol {

        struct is_vop_visitor {
            typedef bool result_type;

            template<typename T>
            bool operator()(const T& v) const {
                return v.is_virtual();
            }
        };

        bool is_virtual_operation(const operation& op) {
            return op.visit(is_vop_visitor());
        }

        struct operation_validate_visitor {
            typedef void result_type;

            template<typename T>
            void operator()(const T& v) const {
                v.validate();
            }
        };

        void operation_validate(const operation& op) {
            op.visit(operation_validate_visitor());
        }

        struct operation_get_required_auth_visitor {
            typedef void result_type;

            flat_set<account_name_type>& auths;

            operation_get_required_auth_visitor(flat_set<account_name_type>& a) : auths(a) {
            }

            template<typename T>
            void operator()(const T& v) const {
                v.get_required_authorities(auths);
            }
        };

        void operation_get_required_authorities(const operation& op, flat_set<account_name_type>& auths) {
            op.visit(operation_get_required_auth_visitor(auths));
        }

        struct operation_name_visitor {
            typedef std::string result_type;

            template<typename T>
            std::string operator()(const T&) const {
                std::string name = fc::get_typename<T>::name();
                auto pos = name.rfind("::");
                if (pos != std::string::npos) {
                    name = name.substr(pos + 2);
                }
                return name;
            }
        };

        std::string operation_name(const operation& op) {
            return op.visit(operation_name_visitor());
        }

        namespace {

            const std::string operation_suffix = "_operation";

            std::string short_name(std::string name) {
                if (name.size() > operation_suffix.size() &&
                    name.compare(name.size() - operation_suffix.size(), operation_suffix.size(), operation_suffix) == 0) {
                    name.erase(name.size() - operation_suffix.size());
                }
                return name;
            }

            std::map<std::string, int64_t> build_operation_tags() {
                std::map<std::string, int64_t> tags;
                operation op;
                for (int64_t i = 0; i < operation::count(); ++i) {
                    op.set_which(i);
                    tags[short_name(operation_name(op))] = i;
                }
                return tags;
            }

            const std::map<std::string, int64_t>& operation_tags() {
                static const auto tags = build_operation_tags();
                return tags;
            }

            struct from_variant_visitor {
                typedef void result_type;

                const fc::variant& var;

                from_variant_visitor(const fc::variant& v) : var(v) {
                }

                template<typename T>
                void operator()(T& v) const {
                    fc::from_variant(var, v);
                }
            };

            struct to_variant_visitor {
                typedef void result_type;

                fc::variant& var;

                to_variant_visitor(fc::variant& v) : var(v) {
                }

                template<typename T>
                void operator()(const T& v) const {
                    fc::to_variant(v, var);
                }
            };

        } // anonymous

} } // mintex::protocol

namespace fc {

    void to_variant(const mintex::protocol::operation& op, fc::variant& var) {
        fc::variant value;
        op.visit(mintex::protocol::to_variant_visitor(value));

        fc::variants pair(2);
        pair[0] = mintex::protocol::short_name(mintex::protocol::operation_name(op));
        pair[1] = std::move(value);
        var = std::move(pair);
    }

    void from_variant(const fc::variant& var, mintex::protocol::operation& op) {
        const auto& pair = var.get_array();
        FC_ASSERT(pair.size() == 2, "Operation must be a [name, body] pair");

        const auto name = pair[0].as_string();
        const auto& tags = mintex::protocol::operation_tags();
        auto itr = tags.find(name);
        FC_ASSERT(itr != tags.end(), "Unknown operation ${name}", ("name", name));

        op.set_which(itr->second);
        op.visit(mintex::protocol::from_variant_visitor(pair[1]));
    }

} // fc
