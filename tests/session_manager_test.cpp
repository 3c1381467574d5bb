#include "powersim/session.hpp"

#include "fake_model.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <regex>
#include <set>
#include <stdexcept>
#include <string>

namespace {

using powersim::SessionManager;
using powersim::SteadyClock;
using powersim_test::FakeModelProbe;
using powersim_test::makeFakeModel;

// Manually advanced monotonic clock.
struct FakeClock {
    SteadyClock::time_point now{SteadyClock::time_point{} + std::chrono::hours(1)};

    SessionManager::TimeSource source() {
        return [this]() { return now; };
    }

    void advance(std::chrono::seconds s) { now += s; }
};

bool checkCapacityEviction() {
    FakeClock clock;
    SessionManager manager(2, std::chrono::seconds(3600), clock.source());

    auto probeA = std::make_shared<FakeModelProbe>();
    const std::string a = manager.create(makeFakeModel(probeA), "a.json");
    clock.advance(std::chrono::seconds(1));
    const std::string b = manager.create(makeFakeModel(std::make_shared<FakeModelProbe>()), "b.json");
    clock.advance(std::chrono::seconds(1));
    const std::string c = manager.create(makeFakeModel(std::make_shared<FakeModelProbe>()), "c.json");

    if (manager.size() != 2) {
        std::cerr << "Capacity 2 exceeded: " << manager.size() << " sessions\n";
        return false;
    }
    if (manager.get(a)) {
        std::cerr << "Least recently used session should have been evicted\n";
        return false;
    }
    if (!probeA->destroyed.load()) {
        std::cerr << "Evicted session's model was not released\n";
        return false;
    }
    if (!manager.get(b) || !manager.get(c)) {
        std::cerr << "Newer sessions must survive eviction\n";
        return false;
    }
    return true;
}

bool checkAccessRefreshesRecency() {
    FakeClock clock;
    SessionManager manager(2, std::chrono::seconds(3600), clock.source());

    const std::string a = manager.create(makeFakeModel(std::make_shared<FakeModelProbe>()), "a.json");
    clock.advance(std::chrono::seconds(1));
    const std::string b = manager.create(makeFakeModel(std::make_shared<FakeModelProbe>()), "b.json");
    clock.advance(std::chrono::seconds(1));
    if (!manager.get(a)) {
        std::cerr << "Session a should be live\n";
        return false;
    }
    clock.advance(std::chrono::seconds(1));
    manager.create(makeFakeModel(std::make_shared<FakeModelProbe>()), "c.json");
    if (!manager.get(a) || manager.get(b)) {
        std::cerr << "Touching a should make b the eviction victim\n";
        return false;
    }
    return true;
}

bool checkEvictionTieBreak() {
    // Frozen clock: every session shares one timestamp; access order decides.
    FakeClock clock;
    SessionManager manager(2, std::chrono::seconds(3600), clock.source());
    const std::string a = manager.create(makeFakeModel(std::make_shared<FakeModelProbe>()), "a.json");
    const std::string b = manager.create(makeFakeModel(std::make_shared<FakeModelProbe>()), "b.json");
    if (!manager.get(a)) {
        std::cerr << "Session a should be live\n";
        return false;
    }
    manager.create(makeFakeModel(std::make_shared<FakeModelProbe>()), "c.json");
    if (manager.get(b) || !manager.get(a)) {
        std::cerr << "Equal timestamps must fall back to access order\n";
        return false;
    }
    return true;
}

bool checkExpiry() {
    FakeClock clock;
    SessionManager manager(10, std::chrono::seconds(60), clock.source());

    auto probe = std::make_shared<FakeModelProbe>();
    const std::string idle = manager.create(makeFakeModel(probe), "idle.json");
    const std::string busy = manager.create(makeFakeModel(std::make_shared<FakeModelProbe>()), "busy.json");

    // Touched every 40 s: never idle longer than the TTL.
    for (int i = 0; i < 5; ++i) {
        clock.advance(std::chrono::seconds(40));
        if (!manager.get(busy)) {
            std::cerr << "Session accessed within its TTL expired at step " << i << '\n';
            return false;
        }
    }

    if (manager.get(idle)) {
        std::cerr << "Idle session should have expired\n";
        return false;
    }
    if (!probe->destroyed.load()) {
        std::cerr << "Expired session's model was not released\n";
        return false;
    }

    // Exactly at the TTL boundary the session is still live.
    const std::string edge = manager.create(makeFakeModel(std::make_shared<FakeModelProbe>()), "edge.json");
    clock.advance(std::chrono::seconds(60));
    if (!manager.get(edge)) {
        std::cerr << "Session idle for exactly the TTL must not expire\n";
        return false;
    }
    clock.advance(std::chrono::seconds(61));
    if (manager.size() != 2 || !manager.list().empty() || manager.size() != 0) {
        std::cerr << "list() should sweep expired sessions\n";
        return false;
    }
    return true;
}

bool checkCloseAndList() {
    FakeClock clock;
    SessionManager manager(5, std::chrono::seconds(3600), clock.source());

    auto probe = std::make_shared<FakeModelProbe>();
    const std::string first = manager.create(makeFakeModel(probe), "first.json");
    clock.advance(std::chrono::seconds(2));
    const std::string second = manager.create(makeFakeModel(std::make_shared<FakeModelProbe>()), "second.json");

    const auto infos = manager.list();
    if (infos.size() != 2 || infos[0].sessionId != first || infos[1].sessionId != second) {
        std::cerr << "list() should report sessions in creation order\n";
        return false;
    }
    if (infos[0].sourcePath != "first.json" || infos[0].lastAccessedAt != infos[0].createdAt) {
        std::cerr << "list() metadata mismatch\n";
        return false;
    }
    clock.advance(std::chrono::seconds(5));
    if (!manager.get(second)) {
        std::cerr << "Session second should be live\n";
        return false;
    }
    const auto touched = manager.list();
    if (touched[1].lastAccessedAt - touched[1].createdAt != std::chrono::seconds(5)) {
        std::cerr << "Access time should advance with the session clock\n";
        return false;
    }

    if (!manager.close(first) || !probe->destroyed.load()) {
        std::cerr << "close() should remove the session and release its model\n";
        return false;
    }
    if (manager.get(first)) {
        std::cerr << "Closed session still reachable\n";
        return false;
    }
    if (manager.close(first) || manager.close("no-such-session")) {
        std::cerr << "Closing an unknown id should report false\n";
        return false;
    }
    if (manager.list().size() != 1) {
        std::cerr << "list() should only report the remaining session\n";
        return false;
    }

    manager.shutdown();
    if (manager.size() != 0 || manager.get(second)) {
        std::cerr << "shutdown() should close every session\n";
        return false;
    }

    auto idleProbe = std::make_shared<FakeModelProbe>();
    const std::string idle = manager.create(makeFakeModel(idleProbe), "idle.json");
    clock.advance(std::chrono::seconds(3601));
    if (manager.close(idle)) {
        std::cerr << "Closing an expired session should report false\n";
        return false;
    }
    if (!idleProbe->destroyed.load() || manager.size() != 0) {
        std::cerr << "Closing an expired session should still release its model\n";
        return false;
    }
    return true;
}

bool checkLeaseReassignment() {
    const auto now = SteadyClock::now();
    const auto wallNow = powersim::WallClock::now();
    auto firstProbe = std::make_shared<FakeModelProbe>();
    powersim_test::FakeModelSetup secondSetup;
    secondSetup.name = "second";
    auto first = std::make_shared<powersim::Session>("first", makeFakeModel(firstProbe), "first.json", now, wallNow);
    auto second = std::make_shared<powersim::Session>(
        "second", makeFakeModel(std::make_shared<FakeModelProbe>(), secondSetup), "second.json", now, wallNow);

    powersim::SessionLease lease = first->acquire();
    first.reset();
    // The lease holds the last reference to the first session here.
    lease = second->acquire();
    if (!firstProbe->destroyed.load()) {
        std::cerr << "Replacing the only lease should release the first session\n";
        return false;
    }
    if (!lease || lease.model().name() != "second") {
        std::cerr << "Reassigned lease should refer to the second session\n";
        return false;
    }

    powersim::SessionLease moved(std::move(lease));
    if (lease || !moved) {
        std::cerr << "Moving a lease should leave the source empty\n";
        return false;
    }
    moved = powersim::SessionLease{};
    if (!second->acquire()) {
        std::cerr << "Clearing a lease should unlock its session\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    if (!checkCapacityEviction()) {
        return 1;
    }
    if (!checkAccessRefreshesRecency()) {
        return 1;
    }
    if (!checkEvictionTieBreak()) {
        return 1;
    }
    if (!checkExpiry()) {
        return 1;
    }
    if (!checkCloseAndList()) {
        return 1;
    }
    if (!checkLeaseReassignment()) {
        return 1;
    }
    if (!checkIds()) {
        return 1;
    }
    if (!checkContractViolations()) {
        return 1;
    }
    return 0;
}
