#ifndef SETTINGS_HPP
#define SETTINGS_HPP
#include <iostream>
#include <string>

/**
 * @brief Which bi-allelic sites survive the transition/transversion filter
 */
enum class SiteMode {
    ALL = 0,
    TRANSVERSIONS_ONLY = 1,
    TRANSITIONS_ONLY = 2
};

/**
 * @brief This struct loads in the user's settings from the command line and provides
 * usage help.
 */
struct Settings {
    #ifdef USE_UI
    Settings(void);
    #else
    Settings(void)=delete;
    #endif
    Settings(int argc, char* argv[]);

    static void usage();
    std::string validate() const; // Returns an empty string if the settings are usable, otherwise the problem

    bool hasCap() const { return maxSnps > 0; }
    SiteMode getSiteMode() const;

    std::string phylipFile = "";
    std::string vcfFile = "";
    std::string tableFile = "example.spc.txt";
    std::string nexFile = "snapp.nex";
    int maxSnps = 0; // Zero means every site is kept
    bool transversionsOnly = false;
    bool transitionsOnly = false;
    bool noAnnotation = false;
    bool setSeed = false;
    unsigned int seed = 1;
};

#endif
