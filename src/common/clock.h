#ifndef WAITINGROOM_CLOCK_H_
#define WAITINGROOM_CLOCK_H_

#include <chrono>
#include <cstdint>

namespace WaitingRoom {

/**
 * Source of wall-clock time in unix seconds, the unit entry and issue times are stored in
 */
class IClock {
public:
	virtual ~IClock() = default;

	virtual int64_t NowSeconds() const = 0;
};

class SystemClock : public IClock {
public:
	int64_t NowSeconds() const override {
		return std::chrono::duration_cast<std::chrono::seconds>(
				std::chrono::system_clock::now().time_since_epoch()).count();
	}
};

} // namespace WaitingRoom

#endif // WAITINGROOM_CLOCK_H_
