#include "expression_fitness.hpp"
#include "../errors.hpp"

#include <cmath>
#include <utility>

namespace evoswarm{
namespace fitness{

    ExpressionFitness::ExpressionFitness(const std::string& expression,
                                         std::size_t dim,
                                         Domain d,
                                         std::vector<Coordinates> known_minima)
        : m_expression(expression),
          m_dim(dim),
          m_domain(d),
          m_minima(std::move(known_minima)),
          m_parser(mup::pckALL_NON_COMPLEX),
          m_values(dim, mup::Value(0.0))
    {
        if (m_expression.empty()) throw ConfigurationError("Expression is empty.");
        if (m_dim == 0) throw ConfigurationError("Expression: dimension must be > 0.");

        static const char* aliases[] = {"x", "y", "z"};
        try {
            for (std::size_t i = 0; i < m_dim; ++i) {
                m_parser.DefineVar("x" + std::to_string(i), mup::Variable(&m_values[i]));
                if (i < 3) m_parser.DefineVar(aliases[i], mup::Variable(&m_values[i]));
            }
            m_parser.SetExpr(m_expression);
            // A first evaluation at the origin catches undefined variables and syntax errors
            m_parser.Eval();
        } catch (const mup::ParserError& e) {
            throw ConfigurationError("Cannot parse expression '" + m_expression + "': " + e.GetMsg());
        }

        for (const auto& p : m_minima) {
            if (p.size() != m_dim) throw ConfigurationError("Expression: minimum of wrong dimension.");
        }
    }

    Real ExpressionFitness::evaluate(const Coordinates& point) const {
        checkDimension(point);

        for (std::size_t i = 0; i < m_dim; ++i) {
            m_values[i] = point[i];
        }

        Real result = 0.0;
        try {
            const mup::IValue& val = m_parser.Eval();
            if (!val.IsScalar()) {
                throw EvaluationError("Expression '" + m_expression + "' does not return a scalar.");
            }
            result = val.GetFloat();
        } catch (const mup::ParserError& e) {
            throw EvaluationError("Error evaluating '" + m_expression + "': " + e.GetMsg());
        }

        if (std::isnan(result)) {
            throw EvaluationError("Expression '" + m_expression + "' is not a number at this point.");
        }
        return result;
    }

} //namespace fitness
} //namespace evoswarm
