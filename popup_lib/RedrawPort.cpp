#include "RedrawPort.h"
#include "Utils.h"

namespace Popup_lib
{
  //------------------------------------------------------------------------
  void ImmediateRedrawPort::requestRedraw()
  {
    if (m_redraw) invokeGuarded("redraw", m_redraw);
  }

  //------------------------------------------------------------------------
  void DeferredRedrawPort::requestRedraw()
  {
    ++m_requests;
    m_pending.store(true);
  }
}
