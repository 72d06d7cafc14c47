#include "cyclodrive/core/phase_driver.h"
#include "cyclodrive/core/exception.h"

#include <boost/log/trivial.hpp>

namespace cyclodrive {

    PhaseDriver::PhaseDriver(double speed)
    {
        set_speed(speed);
    }

    void PhaseDriver::play()
    {
        if (m_play == true)
            return;

        m_play = true;
        BOOST_LOG_TRIVIAL(debug) << __FUNCTION__ << ": resumed at phase " << m_phase;
    }

    void PhaseDriver::stop()
    {
        m_play = false;
        BOOST_LOG_TRIVIAL(debug) << __FUNCTION__ << ": paused at phase " << m_phase;
    }

    void PhaseDriver::toggle()
    {
        if (m_play)
            stop();
        else
            play();
    }

    double PhaseDriver::advance()
    {
        if (m_play)
            m_phase += 0.01 * (m_speed / 60.0);
        return m_phase;
    }

    void PhaseDriver::reset()
    {
        m_phase = 0.0;
        m_speed = default_speed;
    }

    void PhaseDriver::set_speed(double speed)
    {
        if (speed < 0.0)
            throw InvalidArgument("animation speed must not be negative");
        m_speed = speed;
    }

} // namespace cyclodrive
