#include "node/clusterRelay.hpp"

#include "Logging.hpp"
#include "node/packetTypes.hpp"
#include "node/wireCodec.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <utility>

namespace relay::node {

bool TcpUpstreamLink::connect(const std::string& host, std::uint16_t port) {
	return m_client.connect(host, port);
}

bool TcpUpstreamLink::send(const network::Message& message) {
	return m_client.send(message);
}

std::optional<network::Message> TcpUpstreamLink::read() {
	return m_client.read();
}

void TcpUpstreamLink::disconnect() {
	m_client.disconnect();
}


ClusterRelay::ClusterRelay(std::uint16_t listenPort, std::unique_ptr<IUpstreamLink> link)
    : m_listenPort(listenPort), m_link(std::move(link)) {
}

ClusterRelay::~ClusterRelay() {
	stop();
}

bool ClusterRelay::start(const std::string& host, std::uint16_t port, Callbacks callbacks) {
	if (m_state != ClusterState::Standalone) {
		return false;
	}

	m_callbacks = std::move(callbacks);
	m_state     = ClusterState::Connecting;

	if (!m_link->connect(host, port)) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Cluster] Could not reach parent {}:{}. Running without cluster.", host, port));
		m_state = ClusterState::Lost;
		return false;
	}

	m_state = ClusterState::ConnectedUnknownMode;
	if (!m_link->send(makeClusterAnnounce(m_listenPort))) {
		Logger().Log(Logging::LogLevel::Error, "[Cluster] Could not announce to parent. Running without cluster.");
		markLost();
		return false;
	}

	m_reading    = true;
	m_readThread = std::thread(&ClusterRelay::readLoop, this);

	Logger().Log(Logging::LogLevel::Info, std::format("[Cluster] Connected to parent {}:{}.", host, port));
	return true;
}

void ClusterRelay::stop() {
	m_reading = false;
	if (hasParent()) {
		m_link->disconnect();
	}
	if (m_readThread.joinable()) {
		m_readThread.join();
	}
}

bool ClusterRelay::handlePacket(std::string_view data) {
	if (data.empty()) {
		return true;
	}

	const auto type = static_cast<std::uint8_t>(data[0]);
	if (type == toByte(ClusterPacket::Type)) {
		handleType(data);
	} else if (type == toByte(ClusterPacket::ServerData)) {
		handleServerData(data.substr(1));
	} else if (type == toByte(ClusterPacket::MiscData)) {
		handleMiscData(data.substr(1));
	} else {
		return false;
	}
	return true;
}

void ClusterRelay::markLost() {
	const auto previous = m_state.exchange(ClusterState::Lost);
	if (previous == ClusterState::Lost) {
		return;
	}

	m_reading = false;
	m_link->disconnect();
	Logger().Log(Logging::LogLevel::Warning, "[Cluster] Lost connection to parent. Cluster features disabled.");
}

bool ClusterRelay::hasParent() const {
	const auto state = m_state.load();
	return state == ClusterState::ConnectedUnknownMode || state == ClusterState::ConnectedIndependent ||
	       state == ClusterState::ConnectedUnified;
}

bool ClusterRelay::isUnified() const {
	return m_state == ClusterState::ConnectedUnified;
}

void ClusterRelay::sendToParent(const network::Message& message) {
	if (!hasParent()) {
		return;
	}
	if (!m_link->send(message)) {
		markLost();
	}
}

ClusterState ClusterRelay::state() const {
	return m_state;
}

ClusterView ClusterRelay::view() const {
	std::lock_guard<std::mutex> lock(m_viewMutex);
	return m_view;
}

void ClusterRelay::readLoop() {
	while (m_reading) {
		auto data = m_link->read();
		if (!data) {
			if (m_reading && m_callbacks.onLost) {
				m_callbacks.onLost();
			}
			break;
		}
		if (m_callbacks.onData) {
			m_callbacks.onData(std::move(*data));
		}
	}
}

void ClusterRelay::handleType(std::string_view data) {
	const auto unified = data.size() > 1 && static_cast<std::uint8_t>(data[1]) == 1;
	const auto mode    = unified ? ClusterState::ConnectedUnified : ClusterState::ConnectedIndependent;

	auto expected = ClusterState::ConnectedUnknownMode;
	if (!m_state.compare_exchange_strong(expected, mode)) {
		Logger().Log(Logging::LogLevel::Debug, "[Cluster] Ignoring cluster mode packet, mode already known.");
		return;
	}

	Logger().Log(Logging::LogLevel::Info,
	             std::format("[Cluster] Parent runs in {} mode.", unified ? "unified" : "independent"));
}

void ClusterRelay::handleServerData(std::string_view data) {
	const auto json = nlohmann::json::parse(sanitize(data), nullptr, false);
	if (json.is_discarded() || !json.is_object()) {
		Logger().Log(Logging::LogLevel::Warning, "[Cluster] Invalid server data from parent.");
		return;
	}

	ClusterView view;
	for (const auto& item: json.items()) {
		const auto& entry = item.value();
		if (!entry.is_object()) {
			continue;
		}

		ClusterNodeInfo info;
		if (const auto count = entry.find("count"); count != entry.end() && count->is_number_integer()) {
			info.playerCount = count->get<int>();
		}
		if (const auto address = entry.find("address"); address != entry.end() && address->is_string()) {
			info.address = address->get<std::string>();
		}
		view.emplace(item.key(), std::move(info));
	}

	std::lock_guard<std::mutex> lock(m_viewMutex);
	m_view = std::move(view);
}

void ClusterRelay::handleMiscData(std::string_view data) {
	const auto json = nlohmann::json::parse(sanitize(data), nullptr, false);
	if (json.is_discarded()) {
		Logger().Log(Logging::LogLevel::Warning, "[Cluster] Invalid misc data from parent.");
		return;
	}
	Logger().Log(Logging::LogLevel::Debug, std::format("[Cluster] Misc data from parent: {}", json.dump()));
}

} // namespace relay::node
