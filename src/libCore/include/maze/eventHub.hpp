#pragma once

#include "maze/IGameSignalListener.hpp"
#include "maze/types.hpp"

#include <vector>

namespace maze {

//! Allows external components to be updated on internal game events.
class EventHub {
	struct ListenerEntry {
		IGameSignalListener* listener; //!< Pointer to the listener.
		uint64_t signalMask;           //!< What events the listener cares about.
	};

public:
	//! Subscribing an already known listener adds the signals to its mask.
	void subscribe(IGameSignalListener* listener, uint64_t signalMask);
	void unsubscribe(IGameSignalListener* listener);

	//! Signal one or more game events.
	//! \note Combined signals reach each listener one by one, lowest bit first.
	//!       A win is signalled as position change followed by state change.
	void signal(uint64_t signals);

private:
	std::vector<ListenerEntry> m_listeners;
};

} // namespace maze
