#pragma once
#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/raw_string.hpp>

// Lua 5.1 grammar plus the Luau statement extensions (compound assignment, `continue`).
// Luau-only lexemes are accepted here and rejected by the builder under Lua 5.1.
// Every token rule consumes the separators that follow it.
namespace shroud::lua::pegtl_front::grammar {
using namespace tao::pegtl;

// Comments and whitespace
struct long_string : raw_string< '[', '=', ']' > {};
struct short_comment : until< eolf > {};
struct comment : seq< two< '-' >, sor< long_string, short_comment > > {};
struct sep : sor< ascii::space, comment > {};
struct seps : star< sep > {};

template< typename R >
struct tok : seq< R, seps > {};

// Keywords. `continue` is contextual and stays a valid name.
struct str_and : TAO_PEGTL_STRING( "and" ) {};
struct str_break : TAO_PEGTL_STRING( "break" ) {};
struct str_do : TAO_PEGTL_STRING( "do" ) {};
struct str_else : TAO_PEGTL_STRING( "else" ) {};
struct str_elseif : TAO_PEGTL_STRING( "elseif" ) {};
struct str_end : TAO_PEGTL_STRING( "end" ) {};
struct str_false : TAO_PEGTL_STRING( "false" ) {};
struct str_for : TAO_PEGTL_STRING( "for" ) {};
struct str_function : TAO_PEGTL_STRING( "function" ) {};
struct str_if : TAO_PEGTL_STRING( "if" ) {};
struct str_in : TAO_PEGTL_STRING( "in" ) {};
struct str_local : TAO_PEGTL_STRING( "local" ) {};
struct str_nil : TAO_PEGTL_STRING( "nil" ) {};
struct str_not : TAO_PEGTL_STRING( "not" ) {};
struct str_or : TAO_PEGTL_STRING( "or" ) {};
struct str_repeat : TAO_PEGTL_STRING( "repeat" ) {};
struct str_return : TAO_PEGTL_STRING( "return" ) {};
struct str_then : TAO_PEGTL_STRING( "then" ) {};
struct str_true : TAO_PEGTL_STRING( "true" ) {};
struct str_until : TAO_PEGTL_STRING( "until" ) {};
struct str_while : TAO_PEGTL_STRING( "while" ) {};
struct str_continue : TAO_PEGTL_STRING( "continue" ) {};

template< typename Key >
struct key : seq< Key, not_at< identifier_other >, seps > {};

struct sor_keyword : sor< str_and, str_break, str_do, str_elseif, str_else, str_end, str_false, str_for, str_function,
                          str_if, str_in, str_local, str_nil, str_not, str_or, str_repeat, str_return, str_then,
                          str_true, str_until, str_while > {};
struct keyword : seq< sor_keyword, not_at< identifier_other > > {};

struct key_and : key< str_and > {};
struct key_break_word : key< str_break > {};
struct key_do : key< str_do > {};
struct key_else : key< str_else > {};
struct key_elseif : key< str_elseif > {};
struct key_end : key< str_end > {};
struct key_for : key< str_for > {};
struct key_function : key< str_function > {};
struct key_if : key< str_if > {};
struct key_in : key< str_in > {};
struct key_local : key< str_local > {};
struct key_repeat : key< str_repeat > {};
struct key_return : key< str_return > {};
struct key_then : key< str_then > {};
struct key_until : key< str_until > {};
struct key_while : key< str_while > {};

// Names
struct name : seq< not_at< keyword >, identifier > {};
struct name_tok : seq< name, seps > {};

// Punctuation
struct comma : tok< one< ',' > > {};
struct semicolon : tok< one< ';' > > {};
struct lparen : tok< one< '(' > > {};
struct rparen : tok< one< ')' > > {};
struct lbracket : tok< seq< one< '[' >, not_at< sor< one< '[' >, one< '=' > > > > > {};
struct rbracket : tok< one< ']' > > {};
struct lbrace : tok< one< '{' > > {};
struct rbrace : tok< one< '}' > > {};
struct dot : tok< seq< one< '.' >, not_at< one< '.' > > > > {};
struct colon : tok< one< ':' > > {};
struct equals : tok< seq< one< '=' >, not_at< one< '=' > > > > {};

// Literals
struct key_nil : seq< str_nil, not_at< identifier_other > > {};
struct key_true : seq< str_true, not_at< identifier_other > > {};
struct key_false : seq< str_false, not_at< identifier_other > > {};
struct vararg : three< '.' > {};

struct escape_tail : sor< seq< one< 'x' >, xdigit, xdigit >,
                          seq< one< 'u' >, one< '{' >, plus< xdigit >, one< '}' > >,
                          seq< one< 'z' >, star< space > >,
                          seq< digit, rep_opt< 2, digit > >,
                          one< 'a', 'b', 'f', 'n', 'r', 't', 'v', '\\', '"', '\'', '\n' >,
                          seq< one< '\r' >, opt< one< '\n' > > > > {};
struct escaped : seq< one< '\\' >, escape_tail > {};
struct regular : not_one< '\r', '\n', '\\' > {};
template< char Q >
struct short_string : seq< one< Q >, until< one< Q >, sor< escaped, regular > > > {};
struct literal_string : sor< short_string< '"' >, short_string< '\'' >, long_string > {};

struct digits : seq< digit, star< sor< digit, one< '_' > > > > {};
struct xdigits : seq< xdigit, star< sor< xdigit, one< '_' > > > > {};
struct exponent : seq< one< 'e', 'E' >, opt< one< '+', '-' > >, plus< digit > > {};
struct bexponent : seq< one< 'p', 'P' >, opt< one< '+', '-' > >, plus< digit > > {};
struct hexadecimal : seq< one< '0' >, one< 'x', 'X' >, sor< seq< xdigits, opt< one< '.' >, star< xdigit > > >, seq< one< '.' >, plus< xdigit > > >, opt< bexponent > > {};
struct binary : seq< one< '0' >, one< 'b', 'B' >, plus< sor< one< '0', '1' >, one< '_' > > > > {};
struct decimal : seq< sor< seq< digits, opt< one< '.' >, not_at< one< '.' > >, star< digit > > >, seq< one< '.' >, plus< digit > > >, opt< exponent > > {};
struct numeral : seq< sor< hexadecimal, binary, decimal >, not_at< identifier_other > > {};

// Operators (stored as tokens so the builder can read them back)
struct op_or : seq< str_or, not_at< identifier_other > > {};
struct op_and : seq< str_and, not_at< identifier_other > > {};
struct op_not : seq< str_not, not_at< identifier_other > > {};
struct op_cmp : sor< string< '<', '=' >, string< '>', '=' >, string< '~', '=' >, string< '=', '=' >, one< '<' >, one< '>' > > {};
struct op_concat : seq< two< '.' >, not_at< one< '.' > >, not_at< one< '=' > > > {};
struct op_add : seq< one< '+', '-' >, not_at< one< '=' > > > {};
struct op_mul : seq< one< '*', '/', '%' >, not_at< one< '=' > > > {};
struct op_pow : seq< one< '^' >, not_at< one< '=' > > > {};
struct op_len : one< '#' > {};
struct op_neg : seq< one< '-' >, not_at< one< '-' > > > {};
struct op_compound : sor< string< '+', '=' >, string< '-', '=' >, string< '*', '=' >, string< '/', '=' >,
                          string< '%', '=' >, string< '^', '=' >, string< '.', '.', '=' > > {};

// Expressions
struct expr;
struct expr_list : list< expr, comma > {};
struct block;

struct params : opt< sor< tok< vararg >, seq< list< name_tok, comma >, opt< comma, tok< vararg > > > > > {};
struct function_body : seq< lparen, params, rparen, block, key_end > {};
struct function_literal : seq< key_function, function_body > {};

struct field_bracket : seq< lbracket, expr, rbracket, equals, expr > {};
struct field_named : seq< name_tok, equals, expr > {};
struct field_positional : seq< expr > {};
struct field : sor< field_bracket, field_named, field_positional > {};
struct field_sep : sor< comma, semicolon > {};
struct table_constructor : seq< lbrace, opt< list_tail< field, field_sep > >, rbrace > {};

struct call_args : sor< seq< lparen, opt< expr_list >, rparen >, table_constructor, tok< literal_string > > {};
struct paren_expr : seq< lparen, expr, rparen > {};
struct primary_expr : sor< name_tok, paren_expr > {};
struct field_suffix : seq< dot, name_tok > {};
struct index_suffix : seq< lbracket, expr, rbracket > {};
struct method_suffix : seq< colon, name_tok, call_args > {};
struct call_suffix : seq< call_args > {};
struct suffix : sor< field_suffix, index_suffix, method_suffix, call_suffix > {};
struct suffixed_expr : seq< primary_expr, star< suffix > > {};

struct simple_expr : sor< tok< key_nil >, tok< key_true >, tok< key_false >, tok< numeral >, tok< literal_string >,
                          tok< vararg >, function_literal, table_constructor, suffixed_expr > {};
struct expr_unary;
struct expr_pow : seq< simple_expr, opt< tok< op_pow >, expr_unary > > {};
struct unary_op : sor< tok< op_not >, tok< op_len >, tok< op_neg > > {};
struct expr_unary : seq< star< unary_op >, expr_pow > {};
struct expr_mul : seq< expr_unary, star< tok< op_mul >, expr_unary > > {};
struct expr_add : seq< expr_mul, star< tok< op_add >, expr_mul > > {};
struct expr_concat : seq< expr_add, star< tok< op_concat >, expr_add > > {};
struct expr_cmp : seq< expr_concat, star< tok< op_cmp >, expr_concat > > {};
struct expr_and : seq< expr_cmp, star< tok< op_and >, expr_cmp > > {};
struct expr_or : seq< expr_and, star< tok< op_or >, expr_and > > {};
struct expr : seq< expr_or > {};

// Statements
struct local_names : list< name_tok, comma > {};
struct for_names : list< name_tok, comma > {};
struct func_path : list< name_tok, dot > {};
struct func_method : seq< colon, name_tok > {};

struct stat_if : seq< key_if, expr, key_then, block, star< key_elseif, expr, key_then, block >, opt< key_else, block >, key_end > {};
struct stat_while : seq< key_while, expr, key_do, block, key_end > {};
struct stat_do : seq< key_do, block, key_end > {};
struct stat_for_num : seq< key_for, name_tok, equals, expr, comma, expr, opt< comma, expr >, key_do, block, key_end > {};
struct stat_for_in : seq< key_for, for_names, key_in, expr_list, key_do, block, key_end > {};
struct stat_repeat : seq< key_repeat, block, key_until, expr > {};
struct stat_function : seq< key_function, func_path, opt< func_method >, function_body > {};
struct stat_local_function : seq< key_local, key_function, name_tok, function_body > {};
struct stat_local : seq< key_local, local_names, opt< equals, expr_list > > {};
struct stat_return : seq< key_return, opt< expr_list >, opt< semicolon > > {};
struct stat_break : key_break_word {};
struct stat_continue : seq< str_continue, not_at< identifier_other >, seps,
                            not_at< sor< one< '(', '=', '.', '[', ':', '{', '"', '\'', ',' >, op_compound > > > {};
struct assign_targets : list< suffixed_expr, comma > {};
struct stat_assign : seq< assign_targets, equals, expr_list > {};
struct stat_compound : seq< suffixed_expr, tok< op_compound >, expr > {};
struct stat_call : seq< suffixed_expr > {};

struct statement : sor< semicolon, stat_if, stat_while, stat_do, stat_for_num, stat_for_in, stat_repeat, stat_function,
                        stat_local_function, stat_local, stat_break, stat_continue, stat_compound, stat_assign, stat_call > {};
struct block : seq< star< statement >, opt< stat_return > > {};

struct shebang : seq< one< '#' >, until< eolf > > {};
struct chunk : must< opt< shebang >, seps, block, eof > {};

} // namespace shroud::lua::pegtl_front::grammar
