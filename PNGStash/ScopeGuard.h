#pragma once

template<class Lambda>
class ScopeGuard
{
private:
    Lambda m_l;
    bool m_engaged = true;

public:
    ScopeGuard(Lambda l) :
        m_l(l)
    {

    }
    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard(ScopeGuard&&) = delete;
    ~ScopeGuard()
    {
        if(m_engaged)
            m_l();
    }

    ScopeGuard& operator=(const ScopeGuard&) = delete;
    ScopeGuard& operator=(ScopeGuard&&) = delete;

public:
    //Call once the guarded operation succeeded, the cleanup will no longer run
    void Disengage() noexcept { m_engaged = false; }
};
