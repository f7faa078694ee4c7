#include "maze/eventHub.hpp"

#include <algorithm>

namespace maze {

void EventHub::subscribe(IGameSignalListener* listener, uint64_t signalMask) {
	const auto it = std::find_if(m_listeners.begin(), m_listeners.end(), [&](const ListenerEntry& e) { return e.listener == listener; });
	if (it != m_listeners.end()) {
		it->signalMask |= signalMask;
		return;
	}

	m_listeners.push_back({listener, signalMask});
}

void EventHub::unsubscribe(IGameSignalListener* listener) {
	m_listeners.erase(std::remove_if(m_listeners.begin(), m_listeners.end(), [&](const ListenerEntry& e) { return e.listener == listener; }),
	                  m_listeners.end());
}

void EventHub::signal(uint64_t signals) {
	while (signals != GS_None) {
		const auto bit = signals & (~signals + 1u); // Lowest set bit.
		signals &= ~bit;

		for (const auto& [listener, signalMask]: m_listeners) {
			if (signalMask & bit) {
				listener->onGameEvent(static_cast<GameSignal>(bit));
			}
		}
	}
}

} // namespace maze
