#ifndef PRYZMA_SUPPORT_RESULT_HH
#define PRYZMA_SUPPORT_RESULT_HH

#include <concepts>
#include <exception>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace pryzma
{
	// Value type for results that only signal success.
	struct Unit
	{
		constexpr bool operator==(Unit const&) const = default;
	};

	namespace detail
	{
		template <class F, class V>
		concept value_factory =
			std::invocable<F> && std::convertible_to<std::invoke_result_t<F>, V>;
	} // namespace detail

	template <class V, class E> class Result
	{
	public:
		using value_type = V;
		using error_type = E;

		Result(V value) noexcept(std::is_nothrow_move_constructible_v<V>) : m_ok(true)
		{
			std::construct_at(std::addressof(m_val), std::move(value));
		}

		Result(E err) noexcept(std::is_nothrow_move_constructible_v<E>) : m_ok(false)
		{
			std::construct_at(std::addressof(m_err), std::move(err));
		}

		Result(Result const& other)
			requires(std::copy_constructible<V> && std::copy_constructible<E>)
			: m_ok(other.m_ok)
		{
			if (m_ok)
				std::construct_at(std::addressof(m_val), other.m_val);
			else
				std::construct_at(std::addressof(m_err), other.m_err);
		}

		Result(Result&& other) noexcept(std::is_nothrow_move_constructible_v<V>
										&& std::is_nothrow_move_constructible_v<E>)
			: m_ok(other.m_ok)
		{
			if (m_ok)
				std::construct_at(std::addressof(m_val), std::move(other.m_val));
			else
				std::construct_at(std::addressof(m_err), std::move(other.m_err));
		}

		Result& operator=(Result const&) = delete;
		Result& operator=(Result&&) = delete;

		~Result()
		{
			if (m_ok)
				std::destroy_at(std::addressof(m_val));
			else
				std::destroy_at(std::addressof(m_err));
		}

		[[nodiscard]] bool ok() const noexcept { return m_ok; }
		explicit operator bool() const noexcept { return m_ok; }

		V& value() & noexcept
		{
			if (!m_ok)
				std::terminate();
			return m_val;
		}

		V const& value() const& noexcept
		{
			if (!m_ok)
				std::terminate();
			return m_val;
		}

		E& err() & noexcept
		{
			if (m_ok)
				std::terminate();
			return m_err;
		}

		E const& err() const& noexcept
		{
			if (m_ok)
				std::terminate();
			return m_err;
		}

		// Moves the payload out; the result is left holding a moved-from object.
		[[nodiscard]] V take() noexcept(std::is_nothrow_move_constructible_v<V>)
		{
			if (!m_ok)
				std::terminate();
			return std::move(m_val);
		}

		[[nodiscard]] E take_err() noexcept(std::is_nothrow_move_constructible_v<E>)
		{
			if (m_ok)
				std::terminate();
			return std::move(m_err);
		}

		template <typename F>
			requires detail::value_factory<F, V>
		V value_else(F f) const
		{
			if (m_ok)
				return m_val;
			return static_cast<V>(std::invoke(std::move(f)));
		}

		template <typename U>
			requires std::constructible_from<V, U>
		V value_or(U&& v) const
		{
			if (m_ok)
				return m_val;
			return V(std::forward<U>(v));
		}

	private:
		union
		{
			E m_err;
			V m_val;
		};
		bool m_ok;
	};

} // namespace pryzma

#endif /* PRYZMA_SUPPORT_RESULT_HH */
