#pragma once
#include "grammar.hpp"
#include <tao/pegtl/contrib/parse_tree.hpp>

namespace shroud::lua::pegtl_front {

namespace pt = tao::pegtl::parse_tree;

// Nodes kept in the parse tree. Expression precedence levels collapse when they hold a single operand.
template< typename Rule >
using selector = pt::selector< Rule,
    pt::store_content::on<
        grammar::name, grammar::numeral, grammar::literal_string, grammar::vararg,
        grammar::key_nil, grammar::key_true, grammar::key_false,
        grammar::op_or, grammar::op_and, grammar::op_not, grammar::op_cmp, grammar::op_concat, grammar::op_add,
        grammar::op_mul, grammar::op_pow, grammar::op_len, grammar::op_neg, grammar::op_compound,
        grammar::params, grammar::function_literal, grammar::paren_expr,
        grammar::field_suffix, grammar::index_suffix, grammar::method_suffix, grammar::call_suffix, grammar::call_args,
        grammar::table_constructor, grammar::field_bracket, grammar::field_named, grammar::field_positional,
        grammar::local_names, grammar::for_names, grammar::func_path, grammar::func_method, grammar::assign_targets,
        grammar::stat_if, grammar::stat_while, grammar::stat_do, grammar::stat_for_num, grammar::stat_for_in,
        grammar::stat_repeat, grammar::stat_function, grammar::stat_local_function, grammar::stat_local,
        grammar::stat_return, grammar::stat_break, grammar::stat_continue, grammar::stat_assign,
        grammar::stat_compound, grammar::stat_call, grammar::block >,
    pt::fold_one::on<
        grammar::suffixed_expr, grammar::expr_pow, grammar::expr_unary, grammar::expr_mul, grammar::expr_add,
        grammar::expr_concat, grammar::expr_cmp, grammar::expr_and, grammar::expr_or > >;

} // namespace shroud::lua::pegtl_front
