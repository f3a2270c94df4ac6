#ifndef LAYERSYNC_LIFECYCLE_H
#define LAYERSYNC_LIFECYCLE_H

#include <layersync/layersync_base.h>

namespace layersync {
    struct ComponentLifeCycle;

    void LAYERSYNC_EXPORT initialise_component(ComponentLifeCycle &component);

    void LAYERSYNC_EXPORT start_component(ComponentLifeCycle &component);

    void LAYERSYNC_EXPORT stop_component(ComponentLifeCycle &component);

    void LAYERSYNC_EXPORT dispose_component(ComponentLifeCycle &component);

    struct TransitionGuard;

    /**
     * Starts the component in the constructor and stops it in the destructor.
     * The destructor never throws, call stop_component explicitly when the failure needs to be observed.
     */
    struct LAYERSYNC_EXPORT StartStopContext {
        explicit StartStopContext(ComponentLifeCycle &component);

        ~StartStopContext() noexcept;

    private:
        ComponentLifeCycle &_component;
    };

    /**
     * The life-cycle and associated method calls are as follows:
     *
     * * initialise is called once, after construction and configuration (observers, options).
     *
     * * start is called when the component should begin mirroring. For a synchronizer this performs a full
     *   synchronization and installs the listeners on the source tree.
     *
     * * stop is called when mirroring should cease. Everything created by start is released.
     *
     * * dispose is called once at the end of the life of the component.
     *
     * NOTE: start and stop can be called numerous times. A component must be able to start cleanly again after
     *       stop. Stop is not dispose.
     */
    struct LAYERSYNC_EXPORT ComponentLifeCycle {
        virtual ~ComponentLifeCycle() = default;

        [[nodiscard]] bool is_initialised() const;

        [[nodiscard]] bool is_started() const;

        [[nodiscard]] bool is_starting() const;

        [[nodiscard]] bool is_stopping() const;

    protected:
        virtual void initialise() = 0;

        virtual void start() = 0;

        virtual void stop() = 0;

        virtual void dispose() = 0;

    private:
        bool _initialised{false};
        bool _started{false};
        bool _transitioning{false};

        friend TransitionGuard;

        friend void initialise_component(ComponentLifeCycle &component);

        friend void start_component(ComponentLifeCycle &component);

        friend void stop_component(ComponentLifeCycle &component);

        friend void dispose_component(ComponentLifeCycle &component);
    };
} // namespace layersync

#endif //LAYERSYNC_LIFECYCLE_H
