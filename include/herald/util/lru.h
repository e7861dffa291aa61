// Herald
//
// Copyright (C) Matrix Construct Developers, Authors & Contributors
// Copyright (C) 2016-2020 Jason Volk <jason@zemos.net>
//
// Permission to use, copy, modify, and/or distribute this software for any
// purpose with or without fee is hereby granted, provided that the above
// copyright notice and this permission notice is present in all copies. The
// full license for this software is available in the LICENSE file.

#pragma once
#define HAVE_HERALD_UTIL_LRU_H

namespace herald
{
	inline namespace util
	{
		template<class key,
		         class value,
		         class hash = std::hash<key>>
		struct lru;
	}
}

/// Bounded map with least-recently-used eviction.
///
/// get() and emplace() refresh the recency of an entry; find() does not,
/// which allows observers (i.e. invalidation callbacks) to reach an entry
/// without affecting its lifetime. When an insertion exceeds the capacity
/// the least recent entry is handed to the eviction callback and then
/// destroyed. A capacity of zero is unbounded.
///
template<class key,
         class value,
         class hash>
struct herald::util::lru
{
	using order_type = std::list<key>;
	using index_type = std::unordered_map<key, std::pair<value, typename order_type::iterator>, hash>;
	using evict_cb = std::function<void (const key &, value &)>;
	using closure_bool = std::function<bool (const key &, value &)>;

	size_t max;
	order_type order;  // most recent at front
	index_type index;
	evict_cb on_evict;

  private:
	void evict();

  public:
	size_t size() const noexcept
	{
		return index.size();
	}

	bool empty() const noexcept
	{
		return index.empty();
	}

	bool has(const key &k) const
	{
		return index.count(k);
	}

	bool for_each(const closure_bool &);
	value *find(const key &) noexcept;
	value *get(const key &);
	template<class... args> value &emplace(const key &, args&&...);
	bool erase(const key &);
	void resize(const size_t &);
	void clear() noexcept;

	lru(const size_t &max, evict_cb = {});
	lru(lru &&) = delete;
	lru(const lru &) = delete;
};

template<class K,
         class V,
         class H>
herald::util::lru<K, V, H>::lru(const size_t &max,
                                evict_cb on_evict)
:max{max}
,on_evict{std::move(on_evict)}
{
}

template<class K,
         class V,
         class H>
template<class... args>
V &
herald::util::lru<K, V, H>::emplace(const K &k,
                                    args&&... a)
{
	const auto it
	{
		index.find(k)
	};

	if(it != end(index))
	{
		order.splice(begin(order), order, it->second.second);
		return it->second.first;
	}

	V val
	{
		std::forward<args>(a)...
	};

	while(max && index.size() >= max)
		evict();

	order.emplace_front(k);
	const auto iit
	{
		index.emplace(k, std::make_pair(std::move(val), begin(order)))
	};

	return iit.first->second.first;
}

template<class K,
         class V,
         class H>
V *
herald::util::lru<K, V, H>::get(const K &k)
{
	const auto it
	{
		index.find(k)
	};

	if(it == end(index))
		return nullptr;

	order.splice(begin(order), order, it->second.second);
	return &it->second.first;
}

template<class K,
         class V,
         class H>
V *
herald::util::lru<K, V, H>::find(const K &k)
noexcept
{
	const auto it
	{
		index.find(k)
	};

	return it != end(index)?
		&it->second.first:
		nullptr;
}

template<class K,
         class V,
         class H>
bool
herald::util::lru<K, V, H>::for_each(const closure_bool &closure)
{
	for(auto &[k, pair] : index)
		if(!closure(k, pair.first))
			return false;

	return true;
}

template<class K,
         class V,
         class H>
bool
herald::util::lru<K, V, H>::erase(const K &k)
{
	const auto it
	{
		index.find(k)
	};

	if(it == end(index))
		return false;

	order.erase(it->second.second);
	index.erase(it);
	return true;
}

template<class K,
         class V,
         class H>
void
herald::util::lru<K, V, H>::resize(const size_t &max)
{
	this->max = max;
	while(this->max && index.size() > this->max)
		evict();
}

template<class K,
         class V,
         class H>
void
herald::util::lru<K, V, H>::clear()
noexcept
{
	index.clear();
	order.clear();
}

template<class K,
         class V,
         class H>
void
herald::util::lru<K, V, H>::evict()
{
	assert(!order.empty());
	const auto it
	{
		index.find(order.back())
	};

	assert(it != end(index));
	if(on_evict)
		on_evict(it->first, it->second.first);

	index.erase(it);
	order.pop_back();
}
