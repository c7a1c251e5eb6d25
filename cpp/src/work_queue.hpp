#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>

#include <boost/circular_buffer.hpp>

// Fixed-capacity multi-producer multi-consumer queue. Producers never
// block: try_push fails when full. Consumers park in pop until an item
// arrives or the queue is closed; after close, pop returns nullopt even
// if items remain.
template<typename T>
struct work_queue {
	explicit work_queue(std::size_t capacity) : items(capacity) { }

	work_queue(const work_queue&) = delete;
	work_queue& operator =(const work_queue&) = delete;

	bool try_push(T item) {
		{
			const std::lock_guard<std::mutex> lock(this->mutex);
			if(this->closed || this->items.full())
				return false;
			this->items.push_back(std::move(item));
		}
		this->ready.notify_one();
		return true;
	}

	std::optional<T> pop() {
		std::unique_lock<std::mutex> lock(this->mutex);
		this->ready.wait(lock, [this] {
			return this->closed || !this->items.empty(); });
		if(this->closed)
			return std::nullopt;
		T item = std::move(this->items.front());
		this->items.pop_front();
		return item;
	}

	void close() {
		{
			const std::lock_guard<std::mutex> lock(this->mutex);
			this->closed = true;
		}
		this->ready.notify_all();
	}

	bool is_closed() const {
		const std::lock_guard<std::mutex> lock(this->mutex);
		return this->closed;
	}

	std::size_t size() const {
		const std::lock_guard<std::mutex> lock(this->mutex);
		return this->items.size();
	}

	std::size_t capacity() const { return this->items.capacity(); }

	private:
	mutable std::mutex mutex;
	std::condition_variable ready;
	boost::circular_buffer<T> items;
	bool closed = false;
};
