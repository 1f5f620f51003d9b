// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StopOperation.hxx"
#include "StartOperation.hxx"
#include "Supervisor.hxx"
#include "SidecarProcess.hxx"

StopOperation::StopOperation(Supervisor &_supervisor,
			     std::string_view _tenant,
			     SidecarStopHandler &_handler,
			     CancellablePointer &cancel_ptr) noexcept
	:supervisor(_supervisor),
	 logger(supervisor.logger.GetDomain(), _tenant),
	 tenant(_tenant),
	 lock(supervisor.registry.GetLock(tenant)),
	 lock_waiter(BIND_THIS_METHOD(OnLocked)),
	 handler(_handler)
{
	supervisor.AddOperation(*this);
	cancel_ptr = *this;
}

StopOperation::~StopOperation() noexcept = default;

void
StopOperation::Start() noexcept
{
	lock.Lock(lock_waiter);
}

void
StopOperation::Release() noexcept
{
	/* destroying the entry kills the process */
	entry.reset();

	lock_waiter.Cancel();
	if (locked) {
		locked = false;
		lock.Unlock();
	}
}

void
StopOperation::Finish() noexcept
{
	auto &_handler = handler;
	auto &registry = supervisor.registry;
	const std::string _tenant = tenant;

	Release();
	delete this;

	registry.ReleaseLock(_tenant);
	_handler.OnSidecarStopped();
}

void
StopOperation::OnLocked() noexcept
{
	locked = true;

	entry = supervisor.registry.Remove(tenant);
	if (!entry) {
		logger(5, "No sidecar to stop");
		Finish();
		return;
	}

	logger.Fmt(3, "Stopping sidecar (pid {}); released port {}",
		   entry->pid, entry->endpoint.port);

	const auto &config = supervisor.config;
	entry->process->Terminate(config.stop_grace, config.kill_wait,
				  BIND_THIS_METHOD(OnTerminated));
}

void
StopOperation::OnTerminated() noexcept
{
	/* ownership has already been released; a teardown failure
	   is only logged */
	if (auto error = entry->process->GetTerminateError())
		logger(2, "Failed to stop sidecar cleanly: ", error);
	else if (entry->process->HasExited())
		logger(3, "Sidecar stopped");

	Finish();
}

void
StopOperation::Cancel() noexcept
{
	Release();
	delete this;
}

void
StopAllOperation::Child::OnSidecarStopped() noexcept
{
	done = true;
	parent.OnChildDone();
}

void
StopAllOperation::Child::OnSidecarStopError(std::exception_ptr error) noexcept
{
	done = true;
	parent.OnChildError(std::move(error));
}

StopAllOperation::StopAllOperation(Supervisor &_supervisor,
				   SidecarStopHandler &_handler,
				   CancellablePointer &cancel_ptr) noexcept
	:supervisor(_supervisor), handler(_handler)
{
	supervisor.AddOperation(*this);
	cancel_ptr = *this;
}

void
StopAllOperation::Start() noexcept
{
	auto &registry = supervisor.registry;

	for (StartOperation *start : registry.GetActiveStarts())
		start->Supersede();

	for (const auto &tenant : registry.GetTenants()) {
		auto &child = children.emplace_back(*this);
		++n_pending;

		auto *stop = new StopOperation(supervisor, tenant,
					       child, child.cancel_ptr);
		stop->Start();
	}

	if (n_pending == 0) {
		auto &_handler = handler;
		delete this;
		_handler.OnSidecarStopped();
	}
}

void
StopAllOperation::OnChildDone() noexcept
{
	if (--n_pending > 0)
		return;

	supervisor.logger(3, "All sidecars have been stopped");

	auto &_handler = handler;
	delete this;
	_handler.OnSidecarStopped();
}

void
StopAllOperation::OnChildError(std::exception_ptr error) noexcept
{
	supervisor.logger(2, "Failed to stop sidecar: ", error);
	OnChildDone();
}

void
StopAllOperation::Cancel() noexcept
{
	for (auto &child : children)
		if (!child.done)
			child.cancel_ptr.Cancel();

	delete this;
}
