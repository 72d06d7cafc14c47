/**
 * @file phase_driver.h
 * @brief Input shaft phase advanced by a periodic clock
 */

#ifndef CYCLODRIVE_PHASE_DRIVER_H
#define CYCLODRIVE_PHASE_DRIVER_H

#include <chrono>

namespace cyclodrive {

    /**
     * @class PhaseDriver
     * @brief Owns the phase angle of an animated gearbox
     *
     * The host calls advance() once per tick of its timer (tick_interval(),
     * roughly 60 Hz) and regenerates the curve set with phase(). Exports read
     * phase() without touching the driver, so a stopped driver freezes the
     * pose that gets exported.
     */
    class PhaseDriver {
    public:
        static constexpr double default_speed = 200.0;

        PhaseDriver() = default;
        explicit PhaseDriver(double speed);

        void play();
        void stop();
        void toggle();
        bool playing() const { return m_play; }

        /**
         * @brief Advance one tick, phase += 0.01 * speed / 60 while playing
         * @return the phase after the tick
         */
        double advance();

        /**
         * @brief Return to phase 0 and the default speed, keeps play state
         */
        void reset();

        double phase() const { return m_phase; }
        void set_phase(double phase) { m_phase = phase; }

        double speed() const { return m_speed; }
        void set_speed(double speed);

        static std::chrono::milliseconds tick_interval() { return std::chrono::milliseconds(16); }

    private:
        double m_phase { 0.0 };
        double m_speed { default_speed };
        bool m_play { true };
    };

} // namespace cyclodrive

#endif // CYCLODRIVE_PHASE_DRIVER_H
