#pragma once

#include <mintex/protocol/exceptions.hpp>
#include <mintex/protocol/operations.hpp>

namespace mintex { namespace chain {

    using mintex::protocol::operation;

    class database;

    template<typename OperationType = mintex::protocol::operation>
    class evaluator {
    public:
        virtual ~evaluator() {
        }

        virtual void apply(const OperationType& op) = 0;

        virtual int get_type() const = 0;
    };

    template<typename EvaluatorType, typename OperationType = mintex::protocol::operation>
    class evaluator_impl : public evaluator<OperationType> {
    public:
        typedef OperationType operation_sv_type;

        evaluator_impl(database& d)
                : _db(d) {
        }

        virtual void apply(const OperationType& o) final override {
            auto* eval = static_cast<EvaluatorType*>(this);
            const auto& op = o.template get<typename EvaluatorType::operation_type>();
            eval->do_apply(op);
        }

        virtual int get_type() const override {
            return OperationType::template tag<typename EvaluatorType::operation_type>::value;
        }

        database& db() {
            return _db;
        }

    protected:
        database& _db;
    };

} } // mintex::chain

#define DEFINE_EVALUATOR(X) \
class X ## _evaluator : public mintex::chain::evaluator_impl<X ## _evaluator> { \
public: \
    typedef X ## _operation operation_type; \
    \
    X ## _evaluator(database& db) \
            : mintex::chain::evaluator_impl<X ## _evaluator>(db) { \
    } \
    \
    void do_apply(const X ## _operation& o); \
};
