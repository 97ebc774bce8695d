#include <bit>
#include <cstdio>
#include <string>
#include <utility>
#include <pryzma/x86/Machine.hh>

namespace pryzma::x86
{
	namespace
	{
		[[nodiscard]] constexpr std::uint64_t width_mask(std::size_t w) noexcept
		{
			return w >= 8 ? ~std::uint64_t{0} : (std::uint64_t{1} << (8 * w)) - 1;
		}

		[[nodiscard]] constexpr std::uint64_t sign_bit(std::size_t w) noexcept
		{
			return std::uint64_t{1} << (8 * w - 1);
		}

		[[nodiscard]] constexpr std::int64_t sign_extend(std::uint64_t v, std::size_t w) noexcept
		{
			if (w >= 8)
				return static_cast<std::int64_t>(v);

			v &= width_mask(w);
			if (v & sign_bit(w))
				v |= ~width_mask(w);
			return static_cast<std::int64_t>(v);
		}

		[[nodiscard]] bool parity_even(std::uint64_t v) noexcept
		{
			return std::popcount(static_cast<std::uint8_t>(v & 0xff)) % 2 == 0;
		}

		[[nodiscard]] std::string hex(std::uint64_t v)
		{
			char buf[32];
			std::snprintf(buf, sizeof buf, "0x%llx", static_cast<unsigned long long>(v));
			return buf;
		}

		struct U128
		{
			std::uint64_t hi{};
			std::uint64_t lo{};
		};

		[[nodiscard]] U128 mul_u64(std::uint64_t a, std::uint64_t b) noexcept
		{
			auto a_lo = a & 0xffffffffu;
			auto a_hi = a >> 32;
			auto b_lo = b & 0xffffffffu;
			auto b_hi = b >> 32;

			auto p0 = a_lo * b_lo;
			auto p1 = a_lo * b_hi;
			auto p2 = a_hi * b_lo;
			auto p3 = a_hi * b_hi;

			auto mid = (p0 >> 32) + (p1 & 0xffffffffu) + (p2 & 0xffffffffu);

			U128 r{};
			r.lo = (mid << 32) | (p0 & 0xffffffffu);
			r.hi = p3 + (p1 >> 32) + (p2 >> 32) + (mid >> 32);
			return r;
		}

		[[nodiscard]] U128 negate(U128 v) noexcept
		{
			v.lo = ~v.lo + 1;
			v.hi = ~v.hi + (v.lo == 0 ? 1 : 0);
			return v;
		}

		// Requires n.hi < d, so the quotient fits in 64 bits.
		void divmod_u128(U128 n, std::uint64_t d, std::uint64_t& q, std::uint64_t& r) noexcept
		{
			auto rem = n.hi;
			q = 0;

			for (int i = 63; i >= 0; --i)
			{
				auto carry = rem >> 63;
				rem = (rem << 1) | ((n.lo >> i) & 1);
				q <<= 1;
				if (carry || rem >= d)
				{
					rem -= d;
					q |= 1;
				}
			}

			r = rem;
		}

		class Cpu
		{
		public:
			Cpu(Machine& m, AsmProgram const& prog) noexcept : m_m(&m), m_prog(&prog) {}

			[[nodiscard]] ErrorOr<RunStats> run(std::size_t max_steps)
			{
				RunStats stats{};
				auto const& code = m_prog->code;

				while (m_ip < code.size())
				{
					auto const& ins = code[m_ip];
					if (stats.steps >= max_steps)
						return make_error(ErrorKind::resource_limit,
										  ins.span,
										  "assembly block exceeded " + std::to_string(max_steps)
											  + " steps");
					++stats.steps;

					m_next = m_ip + 1;
					m_stop = false;

					auto st = exec(ins);
					if (!st.ok())
						return st.take_err();

					if (m_stop)
					{
						stats.halted = ins.op == Mnemonic::hlt;
						break;
					}

					m_ip = m_next;
				}

				return stats;
			}

		private:
			[[nodiscard]] std::uint64_t address(Mem const& mem) const noexcept
			{
				std::uint64_t a = static_cast<std::uint64_t>(mem.disp);
				if (mem.base)
					a += m_m->reg(*mem.base);
				if (mem.index)
					a += m_m->reg(*mem.index) * mem.scale;
				return a;
			}

			// Frame-relative operands may reach the stack; everything else is
			// held to the data region.
			[[nodiscard]] Status check_access(Mem const& mem, std::uint64_t addr, SourceSpan where) const
			{
				if (mem.base && (*mem.base == Reg::rsp || *mem.base == Reg::rbp))
					return Unit{};
				return m_m->check_data(addr, mem.size, where);
			}

			[[nodiscard]] static std::size_t width(Operand const& op) noexcept
			{
				if (auto const* r = std::get_if<RegRef>(&op))
					return r->width;
				if (auto const* mem = std::get_if<Mem>(&op))
					return mem->size;
				return 8;
			}

			[[nodiscard]] ErrorOr<std::uint64_t> read(Operand const& op, std::size_t w, SourceSpan where) const
			{
				if (auto const* r = std::get_if<RegRef>(&op))
					return m_m->read(*r);
				if (auto const* imm = std::get_if<Imm>(&op))
					return static_cast<std::uint64_t>(imm->value) & width_mask(w);
				if (auto const* mem = std::get_if<Mem>(&op))
				{
					auto addr = address(*mem);
					if (auto st = check_access(*mem, addr, where); !st.ok())
						return st.take_err();
					return m_m->load(addr, mem->size, where);
				}
				return make_error(ErrorKind::parse_error, where, "label used as a value");
			}

			[[nodiscard]] Status write(Operand const& op, std::uint64_t v, SourceSpan where)
			{
				if (auto const* r = std::get_if<RegRef>(&op))
				{
					m_m->write(*r, v);
					return Unit{};
				}
				if (auto const* mem = std::get_if<Mem>(&op))
				{
					auto addr = address(*mem);
					if (auto st = check_access(*mem, addr, where); !st.ok())
						return st;
					return m_m->store(addr, v, mem->size, where);
				}
				return make_error(ErrorKind::parse_error, where, "operand is not writable");
			}

			void set_result_flags(std::uint64_t res, std::size_t w) noexcept
			{
				res &= width_mask(w);
				m_m->set_flag(Flag::zf, res == 0);
				m_m->set_flag(Flag::sf, (res & sign_bit(w)) != 0);
				m_m->set_flag(Flag::pf, parity_even(res));
			}

			std::uint64_t do_add(std::uint64_t a, std::uint64_t b, bool carry_in, std::size_t w) noexcept
			{
				auto mask = width_mask(w);
				a &= mask;
				b &= mask;
				auto cin = carry_in ? std::uint64_t{1} : 0;

				std::uint64_t res{};
				bool carry{};
				if (w >= 8)
				{
					auto s1 = a + b;
					res = s1 + cin;
					carry = s1 < a || res < s1;
				}
				else
				{
					auto full = a + b + cin;
					res = full & mask;
					carry = full > mask;
				}

				m_m->set_flag(Flag::cf, carry);
				m_m->set_flag(Flag::of, ((a ^ res) & (b ^ res) & sign_bit(w)) != 0);
				set_result_flags(res, w);
				return res;
			}

			std::uint64_t do_sub(std::uint64_t a, std::uint64_t b, bool borrow_in, std::size_t w) noexcept
			{
				auto mask = width_mask(w);
				a &= mask;
				b &= mask;

				auto res = (a - b - (borrow_in ? 1 : 0)) & mask;
				m_m->set_flag(Flag::cf, a < b || (borrow_in && a == b));
				m_m->set_flag(Flag::of, ((a ^ b) & (a ^ res) & sign_bit(w)) != 0);
				set_result_flags(res, w);
				return res;
			}

			void logic_flags(std::uint64_t res, std::size_t w) noexcept
			{
				m_m->set_flag(Flag::cf, false);
				m_m->set_flag(Flag::of, false);
				set_result_flags(res, w);
			}

			[[nodiscard]] Status push(std::uint64_t v, SourceSpan where)
			{
				auto sp = m_m->reg(Reg::rsp) - 8;
				if (auto st = m_m->store(sp, v, 8, where); !st.ok())
					return st.take_err();
				m_m->set_reg(Reg::rsp, sp);
				return Unit{};
			}

			[[nodiscard]] ErrorOr<std::uint64_t> pop(SourceSpan where)
			{
				auto sp = m_m->reg(Reg::rsp);
				auto v = m_m->load(sp, 8, where);
				if (!v.ok())
					return v.take_err();
				m_m->set_reg(Reg::rsp, sp + 8);
				return v.take();
			}

			[[nodiscard]] Status exec_shift(Instruction const& ins, std::size_t w)
			{
				auto const& dst = ins.operands[0];
				std::uint64_t count = 1;
				if (ins.operands.size() == 2)
				{
					auto c = read(ins.operands[1], 1, ins.span);
					if (!c.ok())
						return c.take_err();
					count = c.value();
				}
				count &= w == 8 ? 0x3f : 0x1f;
				if (count == 0)
					return Unit{};

				auto cur = read(dst, w, ins.span);
				if (!cur.ok())
					return cur.take_err();

				auto mask = width_mask(w);
				auto bits = 8 * w;
				auto a = cur.value() & mask;
				std::uint64_t res{};

				switch (ins.op)
				{
					case Mnemonic::shl:
					{
						auto cf = count <= bits ? ((a >> (bits - count)) & 1) != 0 : false;
						res = count >= 64 ? 0 : (a << count) & mask;
						m_m->set_flag(Flag::cf, cf);
						m_m->set_flag(Flag::of, ((res & sign_bit(w)) != 0) != cf);
						set_result_flags(res, w);
						break;
					}
					case Mnemonic::shr:
					{
						m_m->set_flag(Flag::cf, count <= bits ? ((a >> (count - 1)) & 1) != 0 : false);
						res = count >= 64 ? 0 : a >> count;
						m_m->set_flag(Flag::of, (a & sign_bit(w)) != 0);
						set_result_flags(res, w);
						break;
					}
					case Mnemonic::sar:
					{
						auto s = sign_extend(a, w);
						auto n = count >= bits ? bits - 1 : count;
						m_m->set_flag(Flag::cf, ((s >> (n - 1)) & 1) != 0);
						res = static_cast<std::uint64_t>(s >> n) & mask;
						m_m->set_flag(Flag::of, false);
						set_result_flags(res, w);
						break;
					}
					case Mnemonic::rol:
					{
						auto n = count % bits;
						res = n == 0 ? a : ((a << n) | (a >> (bits - n))) & mask;
						m_m->set_flag(Flag::cf, (res & 1) != 0);
						m_m->set_flag(Flag::of, ((res & sign_bit(w)) != 0) != ((res & 1) != 0));
						break;
					}
					default:
					{
						auto n = count % bits;
						res = n == 0 ? a : ((a >> n) | (a << (bits - n))) & mask;
						auto msb = (res & sign_bit(w)) != 0;
						m_m->set_flag(Flag::cf, msb);
						m_m->set_flag(Flag::of, msb != ((res & (sign_bit(w) >> 1)) != 0));
						break;
					}
				}

				return write(dst, res, ins.span);
			}

			// Single-operand mul/imul: the implicit accumulator times the operand.
			[[nodiscard]] Status exec_widening_mul(Instruction const& ins, std::size_t w, bool is_signed)
			{
				auto src = read(ins.operands[0], w, ins.span);
				if (!src.ok())
					return src.take_err();

				auto mask = width_mask(w);
				auto a = m_m->reg(Reg::rax) & mask;
				auto b = src.value() & mask;

				std::uint64_t lo{};
				std::uint64_t hi{};
				bool overflow{};

				if (w == 8)
				{
					auto p = mul_u64(a, b);
					if (is_signed)
					{
						if (static_cast<std::int64_t>(a) < 0)
							p.hi -= b;
						if (static_cast<std::int64_t>(b) < 0)
							p.hi -= a;
						overflow = p.hi != (static_cast<std::int64_t>(p.lo) < 0 ? ~std::uint64_t{0} : 0);
					}
					else
						overflow = p.hi != 0;
					lo = p.lo;
					hi = p.hi;
				}
				else
				{
					std::uint64_t full{};
					if (is_signed)
					{
						auto sp = sign_extend(a, w) * sign_extend(b, w);
						full = static_cast<std::uint64_t>(sp);
						overflow = sp != sign_extend(full, w);
					}
					else
					{
						full = a * b;
						overflow = (full >> (8 * w)) != 0;
					}
					lo = full & mask;
					hi = (full >> (8 * w)) & mask;
				}

				if (w == 1)
					m_m->write(RegRef{Reg::rax, 2, false}, (hi << 8) | lo);
				else
				{
					m_m->write(RegRef{Reg::rax, static_cast<std::uint8_t>(w), false}, lo);
					m_m->write(RegRef{Reg::rdx, static_cast<std::uint8_t>(w), false}, hi);
				}

				m_m->set_flag(Flag::cf, overflow);
				m_m->set_flag(Flag::of, overflow);
				set_result_flags(lo, w);
				return Unit{};
			}

			[[nodiscard]] Status exec_imul(Instruction const& ins)
			{
				if (ins.operands.size() == 1)
					return exec_widening_mul(ins, width(ins.operands[0]), true);

				auto const& dst = ins.operands[0];
				auto w = width(dst);

				auto const& lhs_op = ins.operands.size() == 3 ? ins.operands[1] : dst;
				auto const& rhs_op = ins.operands.size() == 3 ? ins.operands[2] : ins.operands[1];

				auto lhs = read(lhs_op, w, ins.span);
				if (!lhs.ok())
					return lhs.take_err();
				auto rhs = read(rhs_op, w, ins.span);
				if (!rhs.ok())
					return rhs.take_err();

				auto a = sign_extend(lhs.value(), w);
				auto b = std::holds_alternative<Imm>(rhs_op) ? std::get<Imm>(rhs_op).value
															  : sign_extend(rhs.value(), w);

				bool overflow{};
				std::uint64_t res{};
				if (w == 8)
				{
					auto p = mul_u64(static_cast<std::uint64_t>(a), static_cast<std::uint64_t>(b));
					if (a < 0)
						p.hi -= static_cast<std::uint64_t>(b);
					if (b < 0)
						p.hi -= static_cast<std::uint64_t>(a);
					overflow = p.hi != (static_cast<std::int64_t>(p.lo) < 0 ? ~std::uint64_t{0} : 0);
					res = p.lo;
				}
				else
				{
					auto full = a * b;
					res = static_cast<std::uint64_t>(full) & width_mask(w);
					overflow = full != sign_extend(res, w);
				}

				m_m->set_flag(Flag::cf, overflow);
				m_m->set_flag(Flag::of, overflow);
				set_result_flags(res, w);
				return write(dst, res, ins.span);
			}

			[[nodiscard]] Status exec_div(Instruction const& ins, bool is_signed)
			{
				auto w = width(ins.operands[0]);
				auto src = read(ins.operands[0], w, ins.span);
				if (!src.ok())
					return src.take_err();

				auto mask = width_mask(w);
				auto d = src.value() & mask;
				if (d == 0)
					return make_error(ErrorKind::division_by_zero, ins.span, "division by zero in assembly block");

				auto overflow = [&] {
					return make_error(ErrorKind::division_by_zero, ins.span, "quotient overflow in assembly block");
				};

				std::uint64_t q{};
				std::uint64_t r{};

				if (w == 8)
				{
					U128 n{m_m->reg(Reg::rdx), m_m->reg(Reg::rax)};
					if (!is_signed)
					{
						if (n.hi >= d)
							return overflow();
						divmod_u128(n, d, q, r);
					}
					else
					{
						auto n_neg = static_cast<std::int64_t>(n.hi) < 0;
						auto d_neg = static_cast<std::int64_t>(d) < 0;
						auto un = n_neg ? negate(n) : n;
						auto ud = d_neg ? 0 - d : d;
						if (un.hi >= ud)
							return overflow();

						divmod_u128(un, ud, q, r);

						auto q_neg = n_neg != d_neg;
						auto limit = q_neg ? std::uint64_t{1} << 63 : (std::uint64_t{1} << 63) - 1;
						if (q > limit)
							return overflow();

						q = q_neg ? 0 - q : q;
						r = n_neg ? 0 - r : r;
					}
				}
				else
				{
					auto bits = 8 * w;
					std::uint64_t n{};
					if (w == 1)
						n = m_m->reg(Reg::rax) & 0xffff;
					else
						n = ((m_m->reg(Reg::rdx) & mask) << bits) | (m_m->reg(Reg::rax) & mask);

					if (!is_signed)
					{
						q = n / d;
						r = n % d;
						if (q > mask)
							return overflow();
					}
					else
					{
						auto sn = sign_extend(n, 2 * w);
						auto sd = sign_extend(d, w);
						auto sq = sn / sd;
						auto sr = sn % sd;
						auto lo = -static_cast<std::int64_t>(sign_bit(w));
						auto hi = static_cast<std::int64_t>(sign_bit(w)) - 1;
						if (sq < lo || sq > hi)
							return overflow();
						q = static_cast<std::uint64_t>(sq) & mask;
						r = static_cast<std::uint64_t>(sr) & mask;
					}
				}

				if (w == 1)
				{
					m_m->write(RegRef{Reg::rax, 1, false}, q);
					m_m->write(RegRef{Reg::rax, 1, true}, r);
				}
				else
				{
					m_m->write(RegRef{Reg::rax, static_cast<std::uint8_t>(w), false}, q);
					m_m->write(RegRef{Reg::rdx, static_cast<std::uint8_t>(w), false}, r);
				}
				return Unit{};
			}

			[[nodiscard]] Status exec(Instruction const& ins)
			{
				auto const& ops = ins.operands;
				auto w = ops.empty() ? std::size_t{8} : width(ops[0]);

				switch (ins.op)
				{
					case Mnemonic::nop:
						return Unit{};

					case Mnemonic::hlt:
						m_stop = true;
						return Unit{};

					case Mnemonic::mov:
					{
						auto v = read(ops[1], w, ins.span);
						if (!v.ok())
							return v.take_err();
						return write(ops[0], v.value(), ins.span);
					}

					case Mnemonic::movzx:
					case Mnemonic::movsx:
					{
						auto sw = width(ops[1]);
						auto v = read(ops[1], sw, ins.span);
						if (!v.ok())
							return v.take_err();
						auto x = ins.op == Mnemonic::movsx ? static_cast<std::uint64_t>(sign_extend(v.value(), sw))
														   : v.value() & width_mask(sw);
						return write(ops[0], x & width_mask(w), ins.span);
					}

					case Mnemonic::lea:
						return write(ops[0], address(std::get<Mem>(ops[1])) & width_mask(w), ins.span);

					case Mnemonic::xchg:
					{
						auto a = read(ops[0], w, ins.span);
						if (!a.ok())
							return a.take_err();
						auto b = read(ops[1], w, ins.span);
						if (!b.ok())
							return b.take_err();
						if (auto st = write(ops[0], b.value(), ins.span); !st.ok())
							return st;
						return write(ops[1], a.value(), ins.span);
					}

					case Mnemonic::add:
					case Mnemonic::adc:
					case Mnemonic::sub:
					case Mnemonic::sbb:
					case Mnemonic::cmp:
					case Mnemonic::and_:
					case Mnemonic::or_:
					case Mnemonic::xor_:
					case Mnemonic::test:
					{
						auto a = read(ops[0], w, ins.span);
						if (!a.ok())
							return a.take_err();
						auto b = read(ops[1], w, ins.span);
						if (!b.ok())
							return b.take_err();

						auto cf = m_m->flag(Flag::cf);
						std::uint64_t res{};
						switch (ins.op)
						{
							case Mnemonic::add:
								res = do_add(a.value(), b.value(), false, w);
								break;
							case Mnemonic::adc:
								res = do_add(a.value(), b.value(), cf, w);
								break;
							case Mnemonic::sub:
							case Mnemonic::cmp:
								res = do_sub(a.value(), b.value(), false, w);
								break;
							case Mnemonic::sbb:
								res = do_sub(a.value(), b.value(), cf, w);
								break;
							case Mnemonic::and_:
							case Mnemonic::test:
								res = a.value() & b.value();
								logic_flags(res, w);
								break;
							case Mnemonic::or_:
								res = a.value() | b.value();
								logic_flags(res, w);
								break;
							default:
								res = a.value() ^ b.value();
								logic_flags(res, w);
								break;
						}

						if (ins.op == Mnemonic::cmp || ins.op == Mnemonic::test)
							return Unit{};
						return write(ops[0], res & width_mask(w), ins.span);
					}

					case Mnemonic::inc:
					case Mnemonic::dec:
					{
						auto a = read(ops[0], w, ins.span);
						if (!a.ok())
							return a.take_err();

						auto cf = m_m->flag(Flag::cf);
						auto res = ins.op == Mnemonic::inc ? do_add(a.value(), 1, false, w)
														   : do_sub(a.value(), 1, false, w);
						m_m->set_flag(Flag::cf, cf);
						return write(ops[0], res, ins.span);
					}

					case Mnemonic::neg:
					{
						auto a = read(ops[0], w, ins.span);
						if (!a.ok())
							return a.take_err();
						auto res = do_sub(0, a.value(), false, w);
						return write(ops[0], res, ins.span);
					}

					case Mnemonic::not_:
					{
						auto a = read(ops[0], w, ins.span);
						if (!a.ok())
							return a.take_err();
						return write(ops[0], ~a.value() & width_mask(w), ins.span);
					}

					case Mnemonic::imul:
						return exec_imul(ins);
					case Mnemonic::mul:
						return exec_widening_mul(ins, w, false);
					case Mnemonic::div:
						return exec_div(ins, false);
					case Mnemonic::idiv:
						return exec_div(ins, true);

					case Mnemonic::cqo:
						m_m->set_reg(Reg::rdx,
									 static_cast<std::int64_t>(m_m->reg(Reg::rax)) < 0 ? ~std::uint64_t{0} : 0);
						return Unit{};

					case Mnemonic::shl:
					case Mnemonic::shr:
					case Mnemonic::sar:
					case Mnemonic::rol:
					case Mnemonic::ror:
						return exec_shift(ins, w);

					case Mnemonic::push:
					{
						auto v = read(ops[0], 8, ins.span);
						if (!v.ok())
							return v.take_err();
						return push(v.value(), ins.span);
					}

					case Mnemonic::pop:
					{
						auto v = pop(ins.span);
						if (!v.ok())
							return v.take_err();
						return write(ops[0], v.value(), ins.span);
					}

					case Mnemonic::jmp:
						m_next = std::get<LabelRef>(ops[0]).target;
						return Unit{};

					case Mnemonic::jcc:
						if (condition_holds(*m_m, ins.cc))
							m_next = std::get<LabelRef>(ops[0]).target;
						return Unit{};

					case Mnemonic::loop:
					{
						auto rcx = m_m->reg(Reg::rcx) - 1;
						m_m->set_reg(Reg::rcx, rcx);
						if (rcx != 0)
							m_next = std::get<LabelRef>(ops[0]).target;
						return Unit{};
					}

					case Mnemonic::call:
						if (auto st = push(m_next, ins.span); !st.ok())
							return st;
						++m_call_depth;
						m_next = std::get<LabelRef>(ops[0]).target;
						return Unit{};

					case Mnemonic::ret:
					{
						if (m_call_depth == 0)
						{
							m_stop = true;
							return Unit{};
						}

						auto target = pop(ins.span);
						if (!target.ok())
							return target.take_err();
						--m_call_depth;

						if (!ops.empty())
							m_m->set_reg(Reg::rsp,
										 m_m->reg(Reg::rsp) + static_cast<std::uint64_t>(std::get<Imm>(ops[0]).value));

						if (target.value() > m_prog->code.size())
						{
							auto e = make_error(ErrorKind::memory_fault,
												ins.span,
												"return to invalid address " + hex(target.value()),
												hex(target.value()));
							return e;
						}
						m_next = static_cast<std::size_t>(target.value());
						return Unit{};
					}

					case Mnemonic::setcc:
						return write(ops[0], condition_holds(*m_m, ins.cc) ? 1 : 0, ins.span);

					case Mnemonic::cmovcc:
					{
						auto v = condition_holds(*m_m, ins.cc) ? read(ops[1], w, ins.span)
															   : read(ops[0], w, ins.span);
						if (!v.ok())
							return v.take_err();
						return write(ops[0], v.value(), ins.span);
					}
				}

				return make_error(ErrorKind::unsupported_opcode,
								  ins.span,
								  "unsupported instruction '" + std::string(mnemonic_name(ins.op)) + "'",
								  std::string(mnemonic_name(ins.op)));
			}

			Machine* m_m{nullptr};
			AsmProgram const* m_prog{nullptr};

			std::size_t m_ip{};
			std::size_t m_next{};
			std::size_t m_call_depth{};
			bool m_stop{};
		};

	} // namespace

	Machine::Machine(std::size_t memory_size) : m_mem(memory_size, 0), m_data_limit(memory_size)
	{
		set_reg(Reg::rsp, memory_size);
	}

	std::uint64_t Machine::read(RegRef r) const noexcept
	{
		auto v = reg(r.reg);
		if (r.high8)
			return (v >> 8) & 0xff;
		return v & width_mask(r.width);
	}

	void Machine::write(RegRef r, std::uint64_t v) noexcept
	{
		auto& slot = m_regs[static_cast<std::size_t>(r.reg)];

		if (r.high8)
		{
			slot = (slot & ~std::uint64_t{0xff00}) | ((v & 0xff) << 8);
			return;
		}

		switch (r.width)
		{
			case 8:
				slot = v;
				break;
			case 4:
				slot = v & 0xffffffffu;
				break;
			default:
			{
				auto mask = width_mask(r.width);
				slot = (slot & ~mask) | (v & mask);
				break;
			}
		}
	}

	Status Machine::check_range(std::uint64_t addr, std::size_t size, SourceSpan where) const
	{
		if (addr > m_mem.size() || size > m_mem.size() - addr)
			return make_error(ErrorKind::memory_fault,
							  where,
							  "memory access out of bounds at address " + hex(addr) + " (size "
								  + std::to_string(size) + ", memory is " + std::to_string(m_mem.size())
								  + " bytes)",
							  hex(addr));
		return Unit{};
	}

	Status Machine::check_data(std::uint64_t addr, std::size_t size, SourceSpan where) const
	{
		if (addr > m_data_limit || size > m_data_limit - addr)
			return make_error(ErrorKind::memory_fault,
							  where,
							  "memory access at address " + hex(addr) + " (size " + std::to_string(size)
								  + ") is outside the " + std::to_string(m_data_limit) + "-byte data region",
							  hex(addr));
		return check_range(addr, size, where);
	}

	ErrorOr<std::uint64_t> Machine::load(std::uint64_t addr, std::size_t size, SourceSpan where) const
	{
		if (auto st = check_range(addr, size, where); !st.ok())
			return st.take_err();

		std::uint64_t v{};
		for (std::size_t i = 0; i < size; ++i)
			v |= static_cast<std::uint64_t>(m_mem[addr + i]) << (8 * i);
		return v;
	}

	Status Machine::store(std::uint64_t addr, std::uint64_t value, std::size_t size, SourceSpan where)
	{
		if (auto st = check_range(addr, size, where); !st.ok())
			return st;

		for (std::size_t i = 0; i < size; ++i)
			m_mem[addr + i] = static_cast<std::uint8_t>(value >> (8 * i));
		return Unit{};
	}

	Status Machine::write_bytes(std::uint64_t addr, std::span<const std::uint8_t> bytes, SourceSpan where)
	{
		if (auto st = check_range(addr, bytes.size(), where); !st.ok())
			return st;

		for (std::size_t i = 0; i < bytes.size(); ++i)
			m_mem[addr + i] = bytes[i];
		return Unit{};
	}

	ErrorOr<std::vector<std::uint8_t>>
	Machine::read_bytes(std::uint64_t addr, std::size_t size, SourceSpan where) const
	{
		if (auto st = check_range(addr, size, where); !st.ok())
			return st.take_err();

		auto first = m_mem.begin() + static_cast<std::ptrdiff_t>(addr);
		return std::vector<std::uint8_t>(first, first + static_cast<std::ptrdiff_t>(size));
	}

	ErrorOr<RunStats> Machine::run(AsmProgram const& prog, std::size_t max_steps)
	{
		Cpu cpu(*this, prog);
		return cpu.run(max_steps);
	}

	bool condition_holds(Machine const& m, Cond cc) noexcept
	{
		auto cf = m.flag(Flag::cf);
		auto zf = m.flag(Flag::zf);
		auto sf = m.flag(Flag::sf);
		auto of = m.flag(Flag::of);
		auto pf = m.flag(Flag::pf);

		switch (cc)
		{
			case Cond::o:
				return of;
			case Cond::no:
				return !of;
			case Cond::b:
				return cf;
			case Cond::ae:
				return !cf;
			case Cond::e:
				return zf;
			case Cond::ne:
				return !zf;
			case Cond::be:
				return cf || zf;
			case Cond::a:
				return !cf && !zf;
			case Cond::s:
				return sf;
			case Cond::ns:
				return !sf;
			case Cond::p:
				return pf;
			case Cond::np:
				return !pf;
			case Cond::l:
				return sf != of;
			case Cond::ge:
				return sf == of;
			case Cond::le:
				return zf || sf != of;
			case Cond::g:
				return !zf && sf == of;
		}

		return false;
	}

} // namespace pryzma::x86
