#pragma once

#include <cstdint>
#include <random>
#include <utility>
#include <algorithm>
#include <iterator>
#include <type_traits>

namespace ACC {
	class Random {
	public:
		// [low, high]
		uint64_t Index(uint64_t low, uint64_t high)
		{
			if (low > high)
				std::swap(low, high);
			return index_dist(m_gen, index_param_t(low, high));
		}

		int Int(int low, int high)
		{
			if (low > high)
				std::swap(low, high);
			return int_dist(m_gen, int_param_t(low, high));
		}

		// std::shuffle requires a RNG engine passed to it, so lets provide a wrapper to use our engine
		template<typename RandomAccessIterator>
		void Shuffle(RandomAccessIterator first, RandomAccessIterator last)
		{
			static_assert(std::is_same<std::random_access_iterator_tag,
					typename std::iterator_traits<RandomAccessIterator>::iterator_category>::value,
					"ACC::Random::Shuffle requires random access iterators");
			std::shuffle(first, last, m_gen);
		}

		void Reseed()
		{
			std::random_device rd;
			m_gen.seed((static_cast<uint64_t>(rd()) << 32) | rd());
		}

		void Reseed(uint64_t seed)
		{
			m_gen.seed(seed);
		}

		Random()
		{
			Reseed();
		}

		explicit Random(uint64_t seed)
		{
			Reseed(seed);
		}

	private:
		typedef std::uniform_int_distribution<uint64_t>::param_type index_param_t;
		std::uniform_int_distribution<uint64_t> index_dist;
		typedef std::uniform_int_distribution<int>::param_type int_param_t;
		std::uniform_int_distribution<int> int_dist;
		std::mt19937_64 m_gen;
	};
}
