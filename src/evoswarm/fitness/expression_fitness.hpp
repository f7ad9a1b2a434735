/**
 * @file expression_fitness.hpp
 * @brief Fitness function parsed at runtime from a text expression (muParserX).
 *
 * The point coordinates are bound to the variables x0, x1, ... x{n-1}; the
 * first three are also available as x, y and z. Everything muParserX offers
 * for real numbers (sin, exp, sqrt, ^, _pi, _e, ...) can be used.
 */

#ifndef EVOSWARM_EXPRESSION_FITNESS_HPP
#define EVOSWARM_EXPRESSION_FITNESS_HPP

#include "fitness_function.hpp"

#include <mpParser.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace evoswarm::fitness {

    class ExpressionFitness : public FitnessFunction {
    public:
        /**
         * @brief Parse and check an expression.
         * @param expression Expression in the variables described above.
         * @param dim Number of coordinates of the points.
         * @param d Domain reported for plotting / initialization.
         * @param known_minima Optional minimizers, if the caller knows them.
         * @throws ConfigurationError if the expression is empty or does not parse.
         */
        ExpressionFitness(const std::string& expression,
                          std::size_t dim = 2,
                          Domain d = Domain{-5.0, -5.0, 5.0, 5.0},
                          std::vector<Coordinates> known_minima = {});

        // Variables point into m_values: the object can be neither copied nor moved
        ExpressionFitness(const ExpressionFitness&) = delete;
        ExpressionFitness& operator=(const ExpressionFitness&) = delete;

        /**
         * @throws EvaluationError on dimension mismatch, on a muParserX error, or
         * when the result is not a real number.
         * Not safe to call concurrently on the same object.
         */
        Real evaluate(const Coordinates& point) const override;

        std::vector<Coordinates> minima() const override { return m_minima; }
        Domain domain() const override { return m_domain; }
        std::size_t dimension() const override { return m_dim; }
        std::string name() const override { return "Expression(" + m_expression + ")"; }

        [[nodiscard]] const std::string& expression() const { return m_expression; }

    private:
        const std::string m_expression;
        const std::size_t m_dim;
        const Domain m_domain;
        const std::vector<Coordinates> m_minima;

        // Parser state changes on every evaluation, the function itself does not
        mutable mup::ParserX m_parser;
        mutable std::vector<mup::Value> m_values;
    };

} // namespace evoswarm::fitness

#endif // EVOSWARM_EXPRESSION_FITNESS_HPP
