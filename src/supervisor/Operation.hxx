// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/Cancellable.hxx"

#include <boost/intrusive/list.hpp>

/**
 * Base class for asynchronous operations of the #Supervisor.  Each
 * one deletes itself when it is finished or cancelled; the
 * #Supervisor keeps track of them so it can cancel all of them when
 * it is destroyed.
 */
class SupervisorOperation
	: public Cancellable,
	  public boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>> {
public:
	virtual ~SupervisorOperation() noexcept = default;
};

using SupervisorOperationList =
	boost::intrusive::list<SupervisorOperation,
			       boost::intrusive::constant_time_size<false>>;
