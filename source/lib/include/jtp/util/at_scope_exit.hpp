#pragma once

#include <utility>

/*
        Calls fun when leaving the scope, unless dismissed before
*/
template<class FunT>
class AtScopeExit
{
  public:
    AtScopeExit() = delete;
    AtScopeExit(const AtScopeExit&) = delete;
    AtScopeExit(AtScopeExit&&) = delete;
    AtScopeExit& operator=(const AtScopeExit&) = delete;
    AtScopeExit& operator=(AtScopeExit&&) = delete;

    AtScopeExit(FunT fun)
        : m_Fun{ std::move(fun) }
    {
    }

    ~AtScopeExit()
    {
        if (m_Armed)
        {
            m_Fun();
        }
    }

    void Dismiss()
    {
        m_Armed = false;
    }

  private:
    FunT m_Fun;
    bool m_Armed{ true };
};
