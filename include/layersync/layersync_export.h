#ifndef LAYERSYNC_EXPORT_H
#define LAYERSYNC_EXPORT_H

// layersync_EXPORTS is defined by the build while compiling the shared library itself.
#if defined(_WIN32) || defined(__CYGWIN__)
#  if defined(layersync_EXPORTS)
#    define LAYERSYNC_EXPORT __declspec(dllexport)
#  else
#    define LAYERSYNC_EXPORT __declspec(dllimport)
#  endif
#  ifdef _MSC_VER
#    pragma warning(disable : 4251 4275)
#  endif
#elif defined(__GNUC__) && __GNUC__ >= 4
#  define LAYERSYNC_EXPORT __attribute__((visibility("default")))
#else
#  define LAYERSYNC_EXPORT
#endif

#endif // LAYERSYNC_EXPORT_H
