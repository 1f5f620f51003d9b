// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cassert>
#include <cstddef>

/**
 * An asynchronous operation which can be cancelled.  Upon
 * cancellation, the operation will not invoke its handler.
 */
class Cancellable {
public:
	/**
	 * Cancel the operation.  The operation must not invoke any
	 * of its handler methods after this call.  The operation is
	 * responsible for releasing all of its resources.
	 */
	virtual void Cancel() noexcept = 0;
};

/**
 * A manager for a #Cancellable pointer.  The operation installs
 * itself here, and the caller may use it to cancel the operation.
 */
class CancellablePointer {
	Cancellable *cancellable = nullptr;

public:
	CancellablePointer() = default;

	constexpr CancellablePointer(std::nullptr_t) noexcept {}

	explicit constexpr CancellablePointer(Cancellable &_cancellable) noexcept
		:cancellable(&_cancellable) {}

	CancellablePointer(const CancellablePointer &) = delete;
	CancellablePointer &operator=(const CancellablePointer &) = delete;

	constexpr operator bool() const noexcept {
		return cancellable != nullptr;
	}

	CancellablePointer &operator=(std::nullptr_t) noexcept {
		cancellable = nullptr;
		return *this;
	}

	CancellablePointer &operator=(Cancellable &_cancellable) noexcept {
		cancellable = &_cancellable;
		return *this;
	}

	/**
	 * Cancel the operation and clear this pointer.
	 */
	void Cancel() noexcept {
		assert(cancellable != nullptr);

		auto *c = cancellable;
		cancellable = nullptr;
		c->Cancel();
	}

	/**
	 * Like Cancel(), but do nothing if no operation is registered.
	 */
	void CancelIfDefined() noexcept {
		if (cancellable != nullptr)
			Cancel();
	}
};
