#include <utility>
#include <vector>
#include <pryzma/lex/Lexer.hh>
#include <pryzma/support/Ctype.hh>
#include <pryzma/x86/Decoder.hh>

namespace pryzma::x86
{
	namespace
	{
		[[nodiscard]] std::string lower(std::string_view s)
		{
			std::string out(s);
			for (auto& c : out)
				c = ascii_tolower(c);
			return out;
		}

		[[nodiscard]] std::optional<std::uint8_t> size_keyword(std::string_view word)
		{
			auto w = lower(word);
			if (w == "byte")
				return 1;
			if (w == "word")
				return 2;
			if (w == "dword")
				return 4;
			if (w == "qword")
				return 8;
			return std::nullopt;
		}

		[[nodiscard]] std::uint8_t operand_width(Operand const& op) noexcept
		{
			if (auto const* r = std::get_if<RegRef>(&op))
				return r->width;
			if (auto const* m = std::get_if<Mem>(&op))
				return m->size;
			return 0;
		}

		struct Arity
		{
			std::size_t min{};
			std::size_t max{};
		};

		[[nodiscard]] Arity arity_of(Mnemonic m) noexcept
		{
			switch (m)
			{
				case Mnemonic::cqo:
				case Mnemonic::nop:
				case Mnemonic::hlt:
					return {0, 0};
				case Mnemonic::ret:
					return {0, 1};

				case Mnemonic::inc:
				case Mnemonic::dec:
				case Mnemonic::neg:
				case Mnemonic::not_:
				case Mnemonic::mul:
				case Mnemonic::div:
				case Mnemonic::idiv:
				case Mnemonic::push:
				case Mnemonic::pop:
				case Mnemonic::jmp:
				case Mnemonic::jcc:
				case Mnemonic::call:
				case Mnemonic::loop:
				case Mnemonic::setcc:
					return {1, 1};

				case Mnemonic::shl:
				case Mnemonic::shr:
				case Mnemonic::sar:
				case Mnemonic::rol:
				case Mnemonic::ror:
					return {1, 2};

				case Mnemonic::imul:
					return {1, 3};

				default:
					return {2, 2};
			}
		}

		[[nodiscard]] bool is_branch(Mnemonic m) noexcept
		{
			return m == Mnemonic::jmp || m == Mnemonic::jcc || m == Mnemonic::call
				   || m == Mnemonic::loop;
		}

		class DecoderImpl
		{
		public:
			DecoderImpl(SourceManager const& sources, SourceSpan body)
			{
				auto begin = body.begin.offset + 1;
				auto end = body.end.offset > begin ? body.end.offset - 1 : begin;

				lex::LexerOptions opt{};
				opt.emit_newlines = true;
				opt.asm_syntax = true;

				lex::Lexer lexer(sources, body.id, begin, end, opt);
				for (;;)
				{
					auto tok = lexer.next();
					m_tokens.push_back(tok);
					if (tok.is(lex::TokenKind::eof))
						break;
				}

				if (lexer.has_error())
				{
					auto const& le = lexer.errors().front();
					m_error = make_error(ErrorKind::lex_error, le.span, le.message);
				}
			}

			[[nodiscard]] ErrorOr<AsmProgram> run()
			{
				if (m_error)
					return std::move(*m_error);

				while (!cur().is(lex::TokenKind::eof))
				{
					if (cur().is(lex::TokenKind::newline))
					{
						advance();
						continue;
					}

					if (!parse_line())
						return std::move(*m_error);
				}

				if (!resolve_labels())
					return std::move(*m_error);

				return std::move(m_prog);
			}

		private:
			[[nodiscard]] lex::Token const& cur() const noexcept { return m_tokens[m_index]; }
			[[nodiscard]] lex::Token const& peek() const noexcept
			{
				return m_index + 1 < m_tokens.size() ? m_tokens[m_index + 1] : m_tokens.back();
			}

			void advance() noexcept
			{
				if (m_index + 1 < m_tokens.size())
					++m_index;
			}

			bool fail(ErrorKind kind, SourceSpan span, std::string message, std::string subject = {})
			{
				if (!m_error)
					m_error = make_error(kind, span, std::move(message), std::move(subject));
				return false;
			}

			bool fail_parse(SourceSpan span, std::string message)
			{
				return fail(ErrorKind::parse_error, span, std::move(message));
			}

			[[nodiscard]] bool at_line_end() const noexcept
			{
				return cur().is(lex::TokenKind::newline) || cur().is(lex::TokenKind::eof);
			}

			bool parse_line()
			{
				if (!cur().is(lex::TokenKind::identifier))
					return fail_parse(cur().span, "expected an instruction or label");

				while (cur().is(lex::TokenKind::identifier) && peek().is(lex::TokenKind::colon))
				{
					auto name = std::string(cur().lexeme);
					if (m_prog.labels.contains(name))
						return fail_parse(cur().span, "duplicate label '" + name + "'");

					m_prog.labels.emplace(std::move(name), m_prog.code.size());
					advance();
					advance();

					if (at_line_end())
						return true;
				}

				if (!cur().is(lex::TokenKind::identifier))
					return fail_parse(cur().span, "expected an instruction");

				auto mn_tok = cur();
				auto info = lookup_mnemonic(mn_tok.lexeme);
				if (!info)
					return fail(ErrorKind::unsupported_opcode,
								mn_tok.span,
								"unsupported instruction '" + std::string(mn_tok.lexeme) + "'",
								lower(mn_tok.lexeme));
				advance();

				Instruction ins{};
				ins.op = info->op;
				ins.cc = info->cc;

				while (!at_line_end())
				{
					Operand op{};
					if (!parse_operand(op, info->op))
						return false;
					ins.operands.push_back(std::move(op));

					if (at_line_end())
						break;

					if (!cur().is(lex::TokenKind::comma))
						return fail_parse(cur().span, "expected ',' between operands");
					advance();
				}

				ins.span = merge_spans(mn_tok.span, m_tokens[m_index > 0 ? m_index - 1 : 0].span);

				if (!check(ins, mn_tok))
					return false;

				m_prog.code.push_back(std::move(ins));
				return true;
			}

			bool parse_immediate(std::int64_t& out)
			{
				auto negative = false;
				if (cur().is(lex::TokenKind::minus))
				{
					negative = true;
					advance();
				}
				else if (cur().is(lex::TokenKind::plus))
					advance();

				std::uint64_t v{};
				if (cur().is(lex::TokenKind::integer))
					v = cur().integer.value;
				else if (cur().is(lex::TokenKind::char_literal) || cur().is(lex::TokenKind::string))
				{
					auto text = lex::unescape_string(cur().lexeme);
					if (!text || text->empty() || text->size() > 8)
						return fail_parse(cur().span, "character constant must hold 1 to 8 bytes");

					for (std::size_t i = 0; i < text->size(); ++i)
						v |= static_cast<std::uint64_t>(static_cast<unsigned char>((*text)[i])) << (8 * i);
				}
				else
					return fail_parse(cur().span, "expected an immediate value");

				advance();
				out = static_cast<std::int64_t>(negative ? 0 - v : v);
				return true;
			}

			bool parse_memory(Mem& mem)
			{
				auto open = cur().span;
				advance();

				auto sign = 1;
				auto first = true;

				while (!cur().is(lex::TokenKind::rbracket))
				{
					if (at_line_end())
						return fail_parse(open, "unterminated memory operand");

					if (!first)
					{
						if (cur().is(lex::TokenKind::plus))
							sign = 1;
						else if (cur().is(lex::TokenKind::minus))
							sign = -1;
						else
							return fail_parse(cur().span, "expected '+' or '-' in memory operand");
						advance();
					}
					else if (cur().is(lex::TokenKind::minus))
					{
						sign = -1;
						advance();
					}
					first = false;

					if (cur().is(lex::TokenKind::identifier))
					{
						auto tok = cur();
						auto r = parse_register(tok.lexeme);
						if (!r || r->width != 8)
							return fail_parse(tok.span,
											  "expected a 64-bit register in memory operand, found '"
												  + std::string(tok.lexeme) + "'");
						if (sign < 0)
							return fail_parse(tok.span, "registers cannot be subtracted in an address");
						advance();

						std::uint8_t scale = 1;
						if (cur().is(lex::TokenKind::star))
						{
							advance();
							if (!cur().is(lex::TokenKind::integer))
								return fail_parse(cur().span, "expected a scale after '*'");

							auto s = cur().integer.value;
							if (s != 1 && s != 2 && s != 4 && s != 8)
								return fail_parse(cur().span, "scale must be 1, 2, 4 or 8");
							scale = static_cast<std::uint8_t>(s);
							advance();
						}

						if (!mem.base && scale == 1)
							mem.base = r->reg;
						else if (!mem.index)
						{
							mem.index = r->reg;
							mem.scale = scale;
						}
						else
							return fail_parse(tok.span, "too many registers in memory operand");
						continue;
					}

					std::int64_t v{};
					if (!parse_immediate(v))
						return false;

					if (cur().is(lex::TokenKind::star))
					{
						advance();
						auto tok = cur();
						auto r = tok.is(lex::TokenKind::identifier) ? parse_register(tok.lexeme)
																	 : std::nullopt;
						if (!r || r->width != 8 || (v != 1 && v != 2 && v != 4 && v != 8) || mem.index)
							return fail_parse(tok.span, "malformed scaled index");
						mem.index = r->reg;
						mem.scale = static_cast<std::uint8_t>(v);
						advance();
						continue;
					}

					mem.disp += sign < 0 ? -v : v;
				}

				advance();
				return true;
			}

			bool parse_operand(Operand& out, Mnemonic m)
			{
				auto tok = cur();

				if (tok.is(lex::TokenKind::identifier))
				{
					if (auto size = size_keyword(tok.lexeme))
					{
						advance();
						if (cur().is(lex::TokenKind::identifier) && lower(cur().lexeme) == "ptr")
							advance();

						if (!cur().is(lex::TokenKind::lbracket))
							return fail_parse(cur().span, "expected '[' after size specifier");

						Mem mem{};
						mem.size = *size;
						if (!parse_memory(mem))
							return false;
						out = mem;
						return true;
					}

					if (auto r = parse_register(tok.lexeme))
					{
						advance();
						out = *r;
						return true;
					}

					if (is_branch(m))
					{
						advance();
						out = LabelRef{std::string(tok.lexeme), 0};
						return true;
					}

					return fail_parse(tok.span, "unknown register '" + std::string(tok.lexeme) + "'");
				}

				if (tok.is(lex::TokenKind::lbracket))
				{
					Mem mem{};
					if (!parse_memory(mem))
						return false;
					out = mem;
					return true;
				}

				std::int64_t v{};
				if (!parse_immediate(v))
					return false;
				out = Imm{v};
				return true;
			}

			bool check(Instruction& ins, lex::Token const& mn_tok)
			{
				auto name = std::string(mn_tok.lexeme);
				auto [min, max] = arity_of(ins.op);
				auto n = ins.operands.size();

				if (n < min || n > max)
				{
					auto expected = min == max ? std::to_string(min)
											   : std::to_string(min) + " to " + std::to_string(max);
					return fail_parse(ins.span,
									  "'" + name + "' expects " + expected + " operand(s), got "
										  + std::to_string(n));
				}

				if (is_branch(ins.op))
				{
					if (!std::holds_alternative<LabelRef>(ins.operands[0]))
						return fail_parse(ins.span, "'" + name + "' needs a label operand");
					return true;
				}

				for (auto const& op : ins.operands)
					if (std::holds_alternative<LabelRef>(op))
						return fail_parse(ins.span, "labels are only valid as jump targets");

				if (n == 0)
					return true;

				auto& dst = ins.operands[0];
				if (std::holds_alternative<Imm>(dst) && ins.op != Mnemonic::push && ins.op != Mnemonic::ret)
					return fail_parse(ins.span, "destination of '" + name + "' cannot be an immediate");

				if (ins.op == Mnemonic::ret && !std::holds_alternative<Imm>(dst))
					return fail_parse(ins.span, "'ret' takes an immediate byte count");

				if (n >= 2 && std::holds_alternative<Mem>(dst) && std::holds_alternative<Mem>(ins.operands[1]))
					return fail_parse(ins.span, "invalid combination of memory operands");

				if (ins.op == Mnemonic::lea
					&& (!std::holds_alternative<RegRef>(dst)
						|| !std::holds_alternative<Mem>(ins.operands[1])))
					return fail_parse(ins.span, "'lea' needs a register and a memory operand");

				if (ins.op == Mnemonic::movzx || ins.op == Mnemonic::movsx)
				{
					auto const* r = std::get_if<RegRef>(&dst);
					auto src_width = operand_width(ins.operands[1]);
					if (!r || std::holds_alternative<Imm>(ins.operands[1]))
						return fail_parse(ins.span, "'" + name + "' needs a register destination and a register or memory source");
					if (src_width == 0)
						return fail_parse(ins.span, "operation size not specified for '" + name + "' source");
					if (src_width >= r->width)
						return fail_parse(ins.span, "source of '" + name + "' must be narrower than the destination");
					return true;
				}

				if (ins.op == Mnemonic::xchg && std::holds_alternative<Imm>(ins.operands[1]))
					return fail_parse(ins.span, "'xchg' cannot take an immediate");

				if (ins.op == Mnemonic::imul && n == 3
					&& (!std::holds_alternative<RegRef>(dst) || !std::holds_alternative<Imm>(ins.operands[2])
						|| std::holds_alternative<Imm>(ins.operands[1])))
					return fail_parse(ins.span, "three-operand 'imul' takes register, register/memory, immediate");

				if (ins.op == Mnemonic::imul && n == 2 && !std::holds_alternative<RegRef>(dst))
					return fail_parse(ins.span, "two-operand 'imul' needs a register destination");

				if (ins.op == Mnemonic::cmovcc
					&& (!std::holds_alternative<RegRef>(dst) || std::holds_alternative<Imm>(ins.operands[1])))
					return fail_parse(ins.span, "'" + name + "' needs a register destination");

				auto is_shift = ins.op == Mnemonic::shl || ins.op == Mnemonic::shr
								|| ins.op == Mnemonic::sar || ins.op == Mnemonic::rol
								|| ins.op == Mnemonic::ror;
				if (is_shift && n == 2)
				{
					auto const* r = std::get_if<RegRef>(&ins.operands[1]);
					auto is_cl = r && r->reg == Reg::rcx && r->width == 1 && !r->high8;
					if (!is_cl && !std::holds_alternative<Imm>(ins.operands[1]))
						return fail_parse(ins.span, "shift count must be an immediate or 'cl'");
				}

				// Infer missing memory sizes from a register operand.
				std::uint8_t width = 0;
				for (auto const& op : ins.operands)
					if (auto const* r = std::get_if<RegRef>(&op); r && !is_shift)
						width = width ? width : r->width;

				if (ins.op == Mnemonic::push || ins.op == Mnemonic::pop)
				{
					width = 8;
					if (auto const* r = std::get_if<RegRef>(&dst); r && r->width != 8)
						return fail_parse(ins.span, "'" + name + "' needs a 64-bit operand");
				}

				if (ins.op == Mnemonic::setcc)
				{
					width = 1;
					if (operand_width(dst) != 1 && operand_width(dst) != 0)
						return fail_parse(ins.span, "'" + name + "' needs an 8-bit operand");
				}

				for (auto& op : ins.operands)
				{
					auto* mem = std::get_if<Mem>(&op);
					if (!mem || mem->size != 0)
						continue;

					if (width == 0)
						return fail_parse(ins.span, "operation size not specified; use byte, word, dword or qword");
					mem->size = width;
				}

				if (n >= 2 && !is_shift && ins.op != Mnemonic::imul)
				{
					auto a = operand_width(dst);
					auto b = operand_width(ins.operands[1]);
					if (a && b && a != b)
						return fail_parse(ins.span, "operand sizes of '" + name + "' do not match");
				}

				return true;
			}

			bool resolve_labels()
			{
				for (auto& ins : m_prog.code)
				{
					for (auto& op : ins.operands)
					{
						auto* label = std::get_if<LabelRef>(&op);
						if (!label)
							continue;

						auto it = m_prog.labels.find(label->name);
						if (it == m_prog.labels.end())
							return fail(ErrorKind::undefined_name,
										ins.span,
										"undefined label '" + label->name + "'",
										label->name);
						label->target = it->second;
					}
				}

				return true;
			}

			std::vector<lex::Token> m_tokens{};
			std::size_t m_index{};

			AsmProgram m_prog{};
			std::optional<Error> m_error{};
		};

	} // namespace

	ErrorOr<AsmProgram> decode(SourceManager const& sources, SourceSpan body)
	{
		DecoderImpl impl(sources, body);
		return impl.run();
	}

} // namespace pryzma::x86
