#pragma once

#include <mintex/chain/evaluator.hpp>

#include <memory>
#include <vector>

namespace mintex { namespace chain {

    template<typename OperationType>
    class evaluator_registry {
    public:
        evaluator_registry(database& d)
                : _db(d) {
            for (int i = 0; i < OperationType::count(); i++) {
                _op_evaluators.emplace_back();
            }
        }

        template<typename EvaluatorType, typename... Args>
        void register_evaluator(Args&&... args) {
            _op_evaluators[OperationType::template tag<typename EvaluatorType::operation_type>::value].reset(
                new EvaluatorType(_db, std::forward<Args>(args)...));
        }

        evaluator<OperationType>& get_evaluator(const OperationType& op) {
            int i_which = op.which();
            uint64_t u_which = uint64_t(i_which);
            FC_ASSERT(i_which >= 0, "Negative operation tag in ${op}", ("op", op));
            FC_ASSERT(u_which < _op_evaluators.size(), "No registered evaluator for operation ${op}", ("op", op));
            std::unique_ptr<evaluator<OperationType>>& eval = _op_evaluators[u_which];
            FC_ASSERT(eval, "No registered evaluator for operation ${op}", ("op", op));
            return *eval;
        }

    private:
        std::vector<std::unique_ptr<evaluator<OperationType>>> _op_evaluators;
        database& _db;
    };

} } // mintex::chain
