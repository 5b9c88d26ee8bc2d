#include "network/network_connectivity.hpp"

#include <QDebug>
#include <QNetworkInformation>

namespace daybook::network {

namespace {

bool reachable(QNetworkInformation::Reachability r) {
    return r == QNetworkInformation::Reachability::Online ||
           r == QNetworkInformation::Reachability::Site ||
           r == QNetworkInformation::Reachability::Unknown;
}

} // namespace

NetworkConnectivity::NetworkConnectivity(QObject* parent)
    : QObject(parent) {
    has_backend_ = QNetworkInformation::loadBackendByFeatures(
        QNetworkInformation::Feature::Reachability);
    auto* info = QNetworkInformation::instance();
    if (!has_backend_ || !info) {
        qWarning() << "SYNC: no network information backend, assuming online";
        return;
    }

    online_ = reachable(info->reachability());
    connect(info, &QNetworkInformation::reachabilityChanged, this,
            [this](QNetworkInformation::Reachability r) { update(reachable(r)); });
}

Subscription NetworkConnectivity::on_change(std::function<void(bool)> callback) {
    return observers_.subscribe(std::move(callback));
}

void NetworkConnectivity::update(bool online) {
    if (online_ == online) return;
    online_ = online;
    qInfo() << "SYNC: connectivity" << (online ? "online" : "offline");
    emit onlineChanged(online);
    observers_.notify(online);
}

} // namespace daybook::network
