#include <layersync/util/lifecycle.h>

#include <cstdio>
#include <exception>

namespace layersync {
    bool ComponentLifeCycle::is_initialised() const { return _initialised; }

    bool ComponentLifeCycle::is_started() const { return _started; }

    bool ComponentLifeCycle::is_starting() const { return _transitioning && !_started; }

    bool ComponentLifeCycle::is_stopping() const { return _transitioning && _started; }

    struct TransitionGuard {
        explicit TransitionGuard(ComponentLifeCycle &component) : _component{component} { _component._transitioning = true; }
        ~TransitionGuard() { _component._transitioning = false; }

    private:
        ComponentLifeCycle &_component;
    };

    /*
     * NOTE the LifeCycle methods are expected to be called on a single thread, so the simple guard clauses
     * used here are sufficient to ensure we don't accidentally start/stop more than once.
     */

    void initialise_component(ComponentLifeCycle &component) {
        if (component.is_initialised()) { return; }
        component.initialise();
        component._initialised = true;
    }

    void start_component(ComponentLifeCycle &component) {
        if (component.is_started() || component.is_starting()) { return; }
        initialise_component(component);
        TransitionGuard guard{component};
        component.start();
        // If start throws the started flag is left false, the guard still clears the transition flag.
        component._started = true;
    }

    void stop_component(ComponentLifeCycle &component) {
        if (!component.is_started() || component.is_stopping()) { return; }
        TransitionGuard guard{component};
        component.stop();
        component._started = false;
    }

    void dispose_component(ComponentLifeCycle &component) {
        if (!component.is_initialised()) { return; }
        stop_component(component);
        component.dispose();
        component._initialised = false;
    }

    StartStopContext::StartStopContext(ComponentLifeCycle &component) : _component{component} {
        start_component(_component);
    }

    StartStopContext::~StartStopContext() noexcept {
        try {
            stop_component(_component);
        } catch (const std::exception &e) {
            // Throwing here would terminate during unwinding, report and carry on.
            std::fprintf(stderr, "Warning: exception during stop_component: %s\n", e.what());
        }
    }
} // namespace layersync
