#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <base/Log.h>

#include <popup_lib/DrawListBackend.h>
#include <popup_lib/PopupManager.h>
#include <popup_lib/ProgressBar.h>
#include <popup_lib/RedrawPort.h>
#include <popup_lib/TaskRunner.h>
#include <popup_lib/TextInput.h>
#include <popup_lib/ThemeLoader.h>
#include <popup_lib/ThemeMetrics.h>
#include <popup_lib/UiTaskQueue.h>

using namespace Popup_lib;

// Headless walk through a modal session: a progress popup driven by a worker,
// followed by a queued confirmation popup closed with Enter.
int main(int argc, char** argv)
{
  const std::string themePath = argc > 1 ? argv[1] : "config/popup_theme.yaml";
  PopupTheme theme = defaultTheme();
  if (!loadThemeYaml(themePath, theme))
    base::LogWarning("using built-in theme");

  ThemeMetrics metrics(theme);
  DrawList drawList;
  DrawListBackend backend(&drawList, { 0, 0, 1280, 720 });
  DeferredRedrawPort redraw;
  UiTaskQueue uiTasks;

  UiContext ctx;
  ctx.metrics = &metrics;
  ctx.backend = &backend;
  ctx.redraw = &redraw;
  ctx.region = { 0, 0, 1280, 720 };
  ctx.layout = theme.layout;

  TaskRunner runner(2);
  PopupManager popups;

  std::string notes;
  auto work = std::make_shared<Popup>("Exporting", "Writing frames to disk.", std::nullopt, std::nullopt, true);
  TextInput& note = work->add().textInput("shot_010");
  ProgressBar& bar = work->add().progressBar(0.f, 100.f, "frames");
  work->onClosed = [&notes, &note](Popup& p) {
    notes = note.text;
    base::Log("'%s' closed", p.title.c_str());
  };
  if (!popups.show(ctx, work)) return 1;

  auto done = std::make_unique<Popup>("Done", "Export finished.");
  done->onClosed = [&notes](Popup&) { base::Log("notes were: %s", notes.c_str()); };
  popups.show(ctx, std::move(done));

  // the worker only holds a weak reference, so it stops once the session is gone
  std::weak_ptr<Popup> weakWork = work;
  std::future<bool> job = runner.submit([weakWork, &bar, &uiTasks] {
    for (int i = 1; i <= 100; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      std::shared_ptr<Popup> p = weakWork.lock();
      if (!p || p->cancelled) return;
      bar.update(static_cast<float>(i));
    }
    uiTasks.post([weakWork] {
      if (std::shared_ptr<Popup> p = weakWork.lock()) {
        p->setPreventClose(false);
        p->addCloseButton("Close");
      }
    });
  });

  // click into the note field and type while the job runs
  const Rect field = note.globalRect(ctx);
  popups.handleEvent(ctx, pointerEvent(PointerEvent::Type::Move, { field.x + 4, field.y + 4 }));
  popups.handleEvent(ctx, pointerEvent(PointerEvent::Type::Down, { field.x + 4, field.y + 4 }, PointerButton::Left));
  popups.handleEvent(ctx, pointerEvent(PointerEvent::Type::Up, { field.x + 4, field.y + 4 }, PointerButton::Left));
  for (char c : std::string(" final"))
    popups.handleEvent(ctx, charEvent(static_cast<char32_t>(c)));

  int frames = 0;
  while (job.wait_for(std::chrono::milliseconds(16)) != std::future_status::ready || uiTasks.pending() > 0) {
    uiTasks.pump();
    if (redraw.consume()) {
      drawList.clear();
      popups.draw(ctx);
      ++frames;
    }
  }
  uiTasks.pump();
  base::Log("job %s after %d redraws", job.get() ? "completed" : "failed", frames);

  // a click on the description leaves the text field, so Enter reaches the popup:
  // the first closes the progress popup through its close button, the second the queued one
  popups.draw(ctx);
  const Rect text = work->children.front()->globalRect(ctx);
  const Vec2 onText{ text.x + 4, text.y + 4 };
  popups.handleEvent(ctx, pointerEvent(PointerEvent::Type::Move, onText));
  popups.handleEvent(ctx, pointerEvent(PointerEvent::Type::Down, onText, PointerButton::Left));
  popups.handleEvent(ctx, pointerEvent(PointerEvent::Type::Up, onText, PointerButton::Left));
  popups.handleEvent(ctx, keyDownEvent(Key::Enter));
  popups.draw(ctx);
  popups.handleEvent(ctx, keyDownEvent(Key::Enter));
  popups.draw(ctx);

  base::Log("draw list: %zu quads, %zu text runs; active popup: %s",
            drawList.quadCount(), drawList.texts.size(), popups.hasActive() ? "yes" : "none");
  runner.stop();
  return popups.hasActive() ? 1 : 0;
}
