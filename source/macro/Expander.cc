#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>
#include <pryzma/lex/Lexer.hh>
#include <pryzma/macro/Expander.hh>
#include <pryzma/macro/Pattern.hh>
#include <pryzma/macro/TokenBuffer.hh>
#include <pryzma/macro/TokenSlice.hh>
#include <pryzma/support/SourceManager.hh>

namespace pryzma::macro
{
	namespace
	{
		namespace fs = std::filesystem;

		// Tokens still to be scanned, stored back to front so the next token is
		// at back() and an expansion can be pushed in front of the rest.
		using Pending = std::vector<lex::Token>;

		[[nodiscard]] lex::TokenKind closer_for(lex::TokenKind open) noexcept
		{
			switch (open)
			{
				case lex::TokenKind::lparen:
					return lex::TokenKind::rparen;
				case lex::TokenKind::lbracket:
					return lex::TokenKind::rbracket;
				default:
					return lex::TokenKind::rbrace;
			}
		}

		void push_front(Pending& pending, std::vector<lex::Token> const& tokens)
		{
			for (auto it = tokens.rbegin(); it != tokens.rend(); ++it)
				pending.push_back(*it);
		}

		[[nodiscard]] std::string canonical_key(std::string_view name)
		{
			std::error_code ec{};
			auto p = fs::weakly_canonical(fs::path(name), ec);
			if (ec)
				return std::string(name);
			return p.string();
		}

		[[nodiscard]] std::vector<lex::Token> strip_newlines(std::span<const lex::Token> tokens)
		{
			std::vector<lex::Token> out{};
			out.reserve(tokens.size());
			for (auto const& t : tokens)
				if (!t.is(lex::TokenKind::newline))
					out.push_back(t);
			return out;
		}

		// Drops the outer brackets and any newlines hugging them.
		[[nodiscard]] std::vector<lex::Token> group_interior(std::vector<lex::Token> const& group)
		{
			if (group.size() < 2)
				return {};

			auto first = group.begin() + 1;
			auto last = group.end() - 1;

			while (first != last && first->is(lex::TokenKind::newline))
				++first;
			while (last != first && (last - 1)->is(lex::TokenKind::newline))
				--last;

			return {first, last};
		}

		[[nodiscard]] std::vector<std::vector<lex::Token>>
		split_call_args(std::vector<lex::Token> const& raw)
		{
			std::vector<std::vector<lex::Token>> out{};
			if (raw.empty())
				return out;

			int depth = 0;
			std::vector<lex::Token> cur{};

			for (auto const& tok : raw)
			{
				if (lex::is_open_bracket(tok.kind))
					++depth;
				else if (lex::is_close_bracket(tok.kind) && depth > 0)
					--depth;

				if (tok.is(lex::TokenKind::comma) && depth == 0)
				{
					out.push_back(std::move(cur));
					cur.clear();
					continue;
				}

				cur.push_back(tok);
			}

			out.push_back(std::move(cur));
			return out;
		}

		class ExpanderImpl
		{
		public:
			ExpanderImpl(SourceManager& sources,
						 MacroTable& table,
						 ExpandOptions const& opt,
						 InsertResolver const& resolver)
				: m_sources(sources), m_table(table), m_opt(opt), m_resolver(resolver)
			{
			}

			[[nodiscard]] Status run(std::span<const lex::Token> tokens, FileId origin)
			{
				m_insert_stack.push_back(canonical_key(m_sources.name(origin)));
				auto st = process(tokens, origin);
				m_insert_stack.pop_back();
				return st;
			}

			[[nodiscard]] std::vector<lex::Token> take_output() { return std::move(m_out); }

		private:
			struct InsertGuard
			{
				ExpanderImpl* self{};
				InsertGuard(ExpanderImpl* s, std::string key) : self(s)
				{
					self->m_insert_stack.push_back(std::move(key));
				}
				~InsertGuard() { self->m_insert_stack.pop_back(); }
			};

			[[nodiscard]] Status process(std::span<const lex::Token> tokens, FileId origin)
			{
				Pending pending{};
				pending.reserve(tokens.size());
				for (auto it = tokens.rbegin(); it != tokens.rend(); ++it)
					if (!it->is(lex::TokenKind::eof))
						pending.push_back(*it);

				while (!pending.empty())
				{
					auto tok = pending.back();
					pending.pop_back();

					switch (tok.kind)
					{
						case lex::TokenKind::dir_macro:
						{
							auto st = define_macro(tok, pending);
							if (!st.ok())
								return st;
							continue;
						}
						case lex::TokenKind::dir_keyword:
						{
							auto st = define_keyword(tok, pending);
							if (!st.ok())
								return st;
							continue;
						}
						case lex::TokenKind::dir_insert:
						{
							auto st = insert_file(tok, pending, origin);
							if (!st.ok())
								return st;
							continue;
						}
						default:
							break;
					}

					if (!tok.is(lex::TokenKind::identifier) || after_dot())
					{
						m_out.push_back(tok);
						continue;
					}

					if (at_statement_start())
					{
						auto rules = m_table.keyword_rules(tok.lexeme);
						if (!rules.empty())
						{
							auto st = expand_keyword(tok, rules, pending);
							if (!st.ok())
								return st;
							continue;
						}
					}

					if (auto const* def = m_table.find_macro(tok.lexeme))
					{
						if (def->function_like
							&& (pending.empty() || !pending.back().is(lex::TokenKind::lparen)))
						{
							m_out.push_back(tok);
							continue;
						}

						auto st = expand_macro(tok, *def, pending);
						if (!st.ok())
							return st;
						continue;
					}

					m_out.push_back(tok);
				}

				return Unit{};
			}

			[[nodiscard]] bool after_dot() const noexcept
			{
				return !m_out.empty() && m_out.back().is(lex::TokenKind::dot);
			}

			[[nodiscard]] bool at_statement_start() const noexcept
			{
				if (m_out.empty())
					return true;

				auto k = m_out.back().kind;
				return k == lex::TokenKind::newline || k == lex::TokenKind::semicolon
					   || k == lex::TokenKind::lbrace;
			}

			[[nodiscard]] static Error
			unexpected(lex::Token const* tok, SourceSpan fallback, std::string what)
			{
				auto span = tok ? tok->span : fallback;
				auto found = tok ? std::string(lex::token_kind_name(tok->kind))
								 : std::string("end of file");
				return make_error(ErrorKind::parse_error, span, what + ", found " + found);
			}

			// Pops a bracketed group including both brackets.
			[[nodiscard]] ErrorOr<std::vector<lex::Token>>
			take_group(Pending& pending, SourceSpan where, std::string const& what)
			{
				std::vector<lex::Token> group{};

				if (pending.empty() || !lex::is_open_bracket(pending.back().kind))
					return unexpected(pending.empty() ? nullptr : &pending.back(), where, what);

				std::vector<lex::TokenKind> stack{};
				auto open_span = pending.back().span;

				while (!pending.empty())
				{
					auto tok = pending.back();
					pending.pop_back();
					group.push_back(tok);

					if (lex::is_open_bracket(tok.kind))
					{
						stack.push_back(closer_for(tok.kind));
						continue;
					}

					if (!lex::is_close_bracket(tok.kind))
						continue;

					if (tok.kind != stack.back())
						return make_error(ErrorKind::parse_error,
										  tok.span,
										  "mismatched " + std::string(lex::token_kind_name(tok.kind)));

					stack.pop_back();
					if (stack.empty())
						return group;
				}

				return make_error(ErrorKind::parse_error, open_span, "unclosed bracket");
			}

			[[nodiscard]] Status define_macro(lex::Token const& intro, Pending& pending)
			{
				std::vector<lex::Token> raw{intro};

				if (pending.empty() || !pending.back().is(lex::TokenKind::identifier))
					return unexpected(pending.empty() ? nullptr : &pending.back(),
									  intro.span,
									  "expected macro name after '#macro'");

				auto name_tok = pending.back();
				pending.pop_back();
				raw.push_back(name_tok);

				MacroDef def{};
				def.name = std::string(name_tok.lexeme);
				def.span = merge_spans(intro.span, name_tok.span);

				if (!pending.empty() && pending.back().is(lex::TokenKind::lparen))
				{
					auto group = take_group(pending, name_tok.span, "expected '(' after macro name");
					if (!group.ok())
						return group.take_err();

					auto params = group.take();
					raw.insert(raw.end(), params.begin(), params.end());
					def.function_like = true;

					auto inner = strip_newlines(group_interior(params));
					for (std::size_t i = 0; i < inner.size(); ++i)
					{
						auto const& p = inner[i];
						if (!p.is(lex::TokenKind::identifier))
							return unexpected(&p, p.span, "expected parameter name");

						auto pname = std::string(p.lexeme);
						if (std::ranges::find(def.params, pname) != def.params.end())
							return make_error(ErrorKind::parse_error,
											  p.span,
											  "duplicate macro parameter '" + pname + "'",
											  pname);
						def.params.push_back(std::move(pname));

						if (i + 1 < inner.size())
						{
							if (!inner[i + 1].is(lex::TokenKind::comma))
								return unexpected(&inner[i + 1], inner[i + 1].span, "expected ',' or ')'");
							++i;
						}
					}
				}

				auto body = take_group(pending, name_tok.span, "expected '{' to open macro body");
				if (!body.ok())
					return body.take_err();

				auto group = body.take();
				if (!group.front().is(lex::TokenKind::lbrace))
					return unexpected(&group.front(), group.front().span, "expected '{' to open macro body");

				raw.insert(raw.end(), group.begin(), group.end());
				def.body = group_interior(group);

				if (auto const* prev = m_table.find_macro(def.name))
				{
					auto e = make_error(ErrorKind::parse_error,
										name_tok.span,
										"redefinition of macro '" + def.name + "'",
										def.name);
					e.notes.push_back(ErrorNote{prev->span, "previous definition is here"});
					return e;
				}

				if (!m_table.define_macro(std::move(def)))
					return make_error(ErrorKind::parse_error, name_tok.span, "cannot define macro");

				m_out.insert(m_out.end(), raw.begin(), raw.end());
				return Unit{};
			}

			[[nodiscard]] Status define_keyword(lex::Token const& intro, Pending& pending)
			{
				std::vector<lex::Token> raw{intro};

				if (pending.empty() || !pending.back().is(lex::TokenKind::identifier))
					return unexpected(pending.empty() ? nullptr : &pending.back(),
									  intro.span,
									  "expected keyword name after '#keyword'");

				auto trigger = pending.back();
				pending.pop_back();
				raw.push_back(trigger);

				std::vector<lex::Token> pattern_toks{};
				int depth = 0;
				for (;;)
				{
					if (pending.empty())
						return make_error(ErrorKind::parse_error,
										  trigger.span,
										  "expected '=>' in keyword definition");

					auto tok = pending.back();
					if (depth == 0 && tok.is(lex::TokenKind::fat_arrow))
						break;
					if (depth == 0 && (tok.is(lex::TokenKind::newline) || tok.is(lex::TokenKind::semicolon)))
						return unexpected(&tok, tok.span, "expected '=>' in keyword definition");

					if (lex::is_open_bracket(tok.kind))
						++depth;
					else if (lex::is_close_bracket(tok.kind) && depth > 0)
						--depth;

					pending.pop_back();
					pattern_toks.push_back(tok);
				}

				raw.push_back(pending.back());
				pending.pop_back();

				auto templ = take_group(pending, trigger.span, "expected '{' to open keyword template");
				if (!templ.ok())
					return templ.take_err();
				auto group = templ.take();
				raw.insert(raw.end(), group.begin(), group.end());

				auto parsed = parse_pattern(make_token_slice(pattern_toks));
				if (!parsed.ok())
				{
					auto const& pe = parsed.errors.front();
					return make_error(ErrorKind::parse_error, pe.span, pe.message);
				}

				KeywordRule rule{};
				rule.trigger = std::string(trigger.lexeme);
				rule.span = merge_spans(intro.span, trigger.span);
				rule.pattern = std::move(parsed.pattern);
				rule.templ = group_interior(group);

				std::unordered_set<std::string> bound{};
				for (auto const& elem : rule.pattern.elems)
					if (auto const* b = std::get_if<PatternBind>(&elem))
						bound.insert(b->name);

				for (std::size_t i = 0; i + 1 < rule.templ.size(); ++i)
				{
					auto const& t = rule.templ[i];
					auto const& n = rule.templ[i + 1];
					if (!t.is(lex::TokenKind::dollar) || !n.is(lex::TokenKind::identifier))
						continue;

					auto name = std::string(n.lexeme);
					if (!bound.contains(name))
						return make_error(ErrorKind::parse_error,
										  merge_spans(t.span, n.span),
										  "unknown binding '$" + name + "' in template",
										  name);
				}

				m_table.add_keyword_rule(std::move(rule));
				m_out.insert(m_out.end(), raw.begin(), raw.end());
				return Unit{};
			}

			[[nodiscard]] ErrorOr<std::uint16_t>
			enter_expansion(lex::Token const& at, std::string const& name, SourceSpan def_span)
			{
				++m_expansions;
				std::size_t depth = static_cast<std::size_t>(at.depth) + 1;

				if (depth > m_opt.max_depth)
				{
					auto e = make_error(ErrorKind::macro_expansion_limit,
										at.span,
										"expansion of '" + name + "' exceeded the depth limit of "
											+ std::to_string(m_opt.max_depth),
										name);
					e.notes.push_back(ErrorNote{def_span, "'" + name + "' defined here"});
					return e;
				}

				if (m_expansions > m_opt.max_expansions)
				{
					auto e = make_error(ErrorKind::macro_expansion_limit,
										at.span,
										"too many macro expansions while expanding '" + name
											+ "' (limit " + std::to_string(m_opt.max_expansions) + ")",
										name);
					e.notes.push_back(ErrorNote{def_span, "'" + name + "' defined here"});
					return e;
				}

				return static_cast<std::uint16_t>(depth);
			}

			[[nodiscard]] Status
			expand_macro(lex::Token const& name_tok, MacroDef const& def, Pending& pending)
			{
				auto d = enter_expansion(name_tok, def.name, def.span);
				if (!d.ok())
					return d.take_err();
				auto depth = d.value();

				std::vector<std::vector<lex::Token>> args{};
				if (def.function_like)
				{
					auto group = take_group(pending, name_tok.span, "expected '(' after macro name");
					if (!group.ok())
						return group.take_err();

					args = split_call_args(strip_newlines(group_interior(group.value())));

					if (args.size() != def.params.size())
					{
						auto e = make_error(ErrorKind::arity_error,
											name_tok.span,
											"macro '" + def.name + "' expects "
												+ std::to_string(def.params.size())
												+ " argument(s), got " + std::to_string(args.size()),
											def.name);
						e.notes.push_back(ErrorNote{def.span, "'" + def.name + "' defined here"});
						return e;
					}
				}

				std::vector<lex::Token> produced{};
				produced.reserve(def.body.size());

				for (auto const& t : def.body)
				{
					auto is_param = false;
					if (t.is(lex::TokenKind::identifier)
						&& (produced.empty() || !produced.back().is(lex::TokenKind::dot)))
					{
						for (std::size_t i = 0; i < def.params.size(); ++i)
						{
							if (def.params[i] != t.lexeme)
								continue;

							produced.insert(produced.end(), args[i].begin(), args[i].end());
							is_param = true;
							break;
						}
					}

					if (!is_param)
						produced.push_back(t);
				}

				for (auto& t : produced)
					t.depth = depth;

				push_front(pending, produced);
				return Unit{};
			}

			[[nodiscard]] Status expand_keyword(lex::Token const& trigger,
												std::span<const KeywordRule> rules,
												Pending& pending)
			{
				auto d = enter_expansion(trigger, std::string(trigger.lexeme), rules.front().span);
				if (!d.ok())
					return d.take_err();
				auto depth = d.value();

				std::vector<lex::Token> stmt{};
				int nesting = 0;

				while (!pending.empty())
				{
					auto const& tok = pending.back();

					if (nesting == 0
						&& (tok.is(lex::TokenKind::newline) || tok.is(lex::TokenKind::semicolon)))
						break;

					if (lex::is_open_bracket(tok.kind))
						++nesting;
					else if (lex::is_close_bracket(tok.kind))
					{
						if (nesting == 0)
							break;
						--nesting;
					}

					stmt.push_back(tok);
					pending.pop_back();
				}

				auto input = make_token_slice(stmt);

				for (auto const& rule : rules)
				{
					MatchResult m{};
					if (!match_pattern(rule.pattern, input, m))
						continue;

					std::vector<lex::Token> produced{};
					for (std::size_t i = 0; i < rule.templ.size(); ++i)
					{
						auto const& t = rule.templ[i];
						if (t.is(lex::TokenKind::dollar) && i + 1 < rule.templ.size()
							&& rule.templ[i + 1].is(lex::TokenKind::identifier))
						{
							auto it = m.bindings.find(std::string(rule.templ[i + 1].lexeme));
							if (it != m.bindings.end())
							{
								auto toks = it->second.tokens();
								produced.insert(produced.end(), toks.begin(), toks.end());
								++i;
								continue;
							}
						}

						produced.push_back(t);
					}

					for (auto& t : produced)
						t.depth = depth;

					push_front(pending, produced);
					return Unit{};
				}

				auto span = stmt.empty() ? trigger.span : merge_spans(trigger.span, input.span);
				auto e = make_error(ErrorKind::parse_error,
									span,
									"no rule of keyword '" + std::string(trigger.lexeme)
										+ "' matches this statement",
									std::string(trigger.lexeme));
				for (auto const& rule : rules)
					e.notes.push_back(ErrorNote{rule.span, "candidate rule defined here"});
				return e;
			}

			[[nodiscard]] ErrorOr<FileId>
			resolve_insert(std::string const& reference, FileId from, SourceSpan where)
			{
				if (m_resolver)
					return m_resolver(reference, from, where);

				auto dir = fs::path(m_sources.name(from)).parent_path();
				std::vector<fs::path> candidates{dir / reference};
				if (fs::path(reference).extension().empty())
				{
					candidates.push_back(dir / (reference + ".pryzma"));
					candidates.push_back(dir / (reference + ".prz"));
				}

				for (auto const& c : candidates)
				{
					std::error_code ec{};
					if (!fs::is_regular_file(c, ec))
						continue;

					auto opened = m_sources.open_read(c.string());
					if (opened.ok())
						return opened.value();
				}

				return make_error(ErrorKind::module_not_found,
								  where,
								  "cannot find file '" + reference + "' to insert",
								  reference);
			}

			[[nodiscard]] Status insert_file(lex::Token const& intro, Pending& pending, FileId origin)
			{
				if (pending.empty() || !pending.back().is(lex::TokenKind::string))
					return unexpected(pending.empty() ? nullptr : &pending.back(),
									  intro.span,
									  "expected a quoted path after '#insert'");

				auto path_tok = pending.back();
				pending.pop_back();

				auto where = merge_spans(intro.span, path_tok.span);
				auto reference = lex::unescape_string(path_tok.lexeme);
				if (!reference)
					return make_error(ErrorKind::parse_error, path_tok.span, "invalid escape in path");

				auto resolved = resolve_insert(*reference, origin, where);
				if (!resolved.ok())
					return resolved.take_err();
				auto file = resolved.value();

				auto key = canonical_key(m_sources.name(file));
				if (std::ranges::find(m_insert_stack, key) != m_insert_stack.end())
				{
					auto e = make_error(ErrorKind::circular_import,
										where,
										"circular #insert of '" + *reference + "'",
										*reference);

					std::string chain{};
					for (auto const& k : m_insert_stack)
						chain += k + " -> ";
					chain += key;
					e.notes.push_back(ErrorNote{{}, "insert chain: " + chain});
					return e;
				}

				TokenBuffer buf(m_sources, file);
				if (auto err = buf.first_error())
					return *err;

				InsertGuard guard(this, std::move(key));
				return process(buf.tokens(), file);
			}

			SourceManager& m_sources;
			MacroTable& m_table;
			ExpandOptions const& m_opt;
			InsertResolver const& m_resolver;

			std::vector<lex::Token> m_out{};
			std::vector<std::string> m_insert_stack{};
			std::size_t m_expansions{};
		};

	} // namespace

	Expander::Expander(SourceManager& sources, MacroTable& table, ExpandOptions opt) noexcept
		: m_sources(&sources), m_table(&table), m_opt(opt)
	{
	}

	void Expander::set_insert_resolver(InsertResolver resolver)
	{
		m_resolver = std::move(resolver);
	}

	ErrorOr<std::vector<lex::Token>> Expander::expand(std::span<const lex::Token> tokens,
													   FileId origin)
	{
		ExpanderImpl impl(*m_sources, *m_table, m_opt, m_resolver);

		auto st = impl.run(tokens, origin);
		if (!st.ok())
			return st.take_err();

		auto out = impl.take_output();

		lex::Token eof{};
		eof.kind = lex::TokenKind::eof;
		if (!tokens.empty())
			eof = tokens.back();
		eof.kind = lex::TokenKind::eof;
		eof.lexeme = {};
		out.push_back(eof);

		return out;
	}

	ErrorOr<std::vector<lex::Token>> Expander::expand_file(FileId file)
	{
		TokenBuffer buf(*m_sources, file);
		if (auto err = buf.first_error())
			return *err;

		return expand(buf.tokens(), file);
	}

} // namespace pryzma::macro
