#pragma once

#include "binary_search.hpp"

#include <cstdint>

#include <utility>
#include <vector>

namespace LineFlow {

/**
 * Run-length encoded values over a character index space. Run `i` covers [get_run_start(i), get_run_limit(i)).
 * There is always at least one run, so a value exists even for empty text (the value inserted text inherits).
 */
template <typename T>
class ValueRuns {
	public:
		using value_type = T;

		ValueRuns() = default;
		template <typename U>
		explicit ValueRuns(U&& value, uint32_t limit = 0)
				: m_values{std::forward<U>(value)}
				, m_limits{limit} {}

		ValueRuns(ValueRuns&&) noexcept = default;
		ValueRuns& operator=(ValueRuns&&) noexcept = default;

		ValueRuns(const ValueRuns&) = default;
		ValueRuns& operator=(const ValueRuns&) = default;

		const T& get_run_value(size_t runIndex) const {
			return m_values[runIndex];
		}

		uint32_t get_run_limit(size_t runIndex) const {
			return m_limits[runIndex];
		}

		uint32_t get_run_start(size_t runIndex) const {
			return runIndex == 0 ? 0 : m_limits[runIndex - 1];
		}

		size_t get_run_count() const {
			return m_limits.size();
		}

		uint32_t get_limit() const {
			return m_limits.empty() ? 0 : m_limits.back();
		}

		bool empty() const {
			return m_values.empty();
		}

		size_t get_run_containing_index(uint32_t index) const {
			auto run = binary_search<size_t>(0, m_limits.size(), [&](auto i) {
				return m_limits[i] <= index;
			});

			return run == m_limits.size() && run > 0 ? run - 1 : run;
		}

		const T& get_value(uint32_t index) const {
			return m_values[get_run_containing_index(index)];
		}

		/**
		 * Calls `func(start, limit, value)` for every run intersecting [offset, offset + length), with the bounds
		 * clipped to that range.
		 */
		template <typename Functor>
		void for_each_run_in_range(uint32_t offset, uint32_t length, Functor&& func) const {
			auto end = offset + length;

			for (auto i = get_run_containing_index(offset); i < m_limits.size(); ++i) {
				auto start = std::max(get_run_start(i), offset);
				auto limit = std::min(m_limits[i], end);

				if (start >= end) {
					break;
				}

				if (limit > start) {
					func(start, limit, m_values[i]);
				}
			}
		}

		/**
		 * Assigns `value` to [start, end), extending the runs if `end` lies past the current limit.
		 */
		void set_value(uint32_t start, uint32_t end, const T& value) {
			if (start >= end) {
				return;
			}

			std::vector<T> values;
			std::vector<uint32_t> limits;
			bool emitted = false;

			auto emit = [&](uint32_t limit, const T& v) {
				if (!limits.empty() && values.back() == v) {
					limits.back() = limit;
				}
				else if (limits.empty() ? limit > 0 : limit > limits.back()) {
					values.push_back(v);
					limits.push_back(limit);
				}
			};

			for (size_t i = 0; i < m_limits.size(); ++i) {
				auto runStart = get_run_start(i);
				auto runLimit = m_limits[i];

				if (runStart < start) {
					emit(std::min(runLimit, start), m_values[i]);
				}

				if (!emitted && runLimit >= start && runLimit > runStart && runStart <= end) {
					emit(end, value);
					emitted = true;
				}

				if (runLimit > end) {
					emit(runLimit, m_values[i]);
				}
			}

			if (!emitted) {
				if (limits.empty() && start > 0) {
					emit(start, m_values.empty() ? value : m_values.back());
				}

				emit(end, value);
			}

			if (limits.empty()) {
				values.push_back(value);
				limits.push_back(0);
			}

			m_values = std::move(values);
			m_limits = std::move(limits);
		}

		/**
		 * Adjusts the runs for replacing the characters in [location, location + oldLength) with `newLength`
		 * characters carrying `insertedValue`.
		 */
		void replace(uint32_t location, uint32_t oldLength, uint32_t newLength, const T& insertedValue) {
			auto oldEnd = location + oldLength;

			for (auto& limit : m_limits) {
				if (limit >= oldEnd) {
					limit = limit - oldLength + newLength;
				}
				else if (limit > location) {
					limit = location;
				}
			}

			// Drop runs emptied by the removal and merge the neighbours it joined, keeping at least one run
			size_t out = 0;

			for (size_t i = 0; i < m_limits.size(); ++i) {
				auto start = out == 0 ? 0u : m_limits[out - 1];

				if (m_limits[i] > start || (out == 0 && i + 1 == m_limits.size())) {
					if (out > 0 && m_values[out - 1] == m_values[i]) {
						m_limits[out - 1] = m_limits[i];
						continue;
					}

					if (out != i) {
						m_values[out] = std::move(m_values[i]);
					}

					m_limits[out] = m_limits[i];
					++out;
				}
			}

			m_values.resize(out);
			m_limits.resize(out);

			// The inserted span currently belongs to the run that covered `location`
			if (newLength > 0) {
				set_value(location, location + newLength, insertedValue);
			}
		}
	private:
		std::vector<T> m_values;
		std::vector<uint32_t> m_limits;
};

}
