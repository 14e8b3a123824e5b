#include "Settings.hpp"
#include "Msg.hpp"
#include <boost/lexical_cast.hpp>
#include <cstdlib>
#include <map>
#include <vector>

#ifdef USE_UI
#include <ftxui/component/captured_mouse.hpp>
#include <ftxui/component/component.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/component/loop.hpp>

using namespace ftxui;

Component wrapFormElement(std::string label, Component& c){
    return Renderer(c, [&] {
        return hbox({
            text(label) | size(WIDTH, EQUAL, 30),
            separator(),
            c->Render() | xflex,
        }) | xflex;
    });
}

Settings::Settings(){
    auto screen = ScreenInteractive::FitComponent();

    bool submitted = false;
    std::string errorMessage = "";

    int usingVcf = 0;
    std::vector<std::string> formatChoices = {
        "Phylip Input",
        "VCF Input"
    };
    auto formatBoxes = Radiobox(&formatChoices, &usingVcf);
    auto formatInput = wrapFormElement("Input Format", formatBoxes);

    std::string inputFile = "";
    auto inputField = Input(&inputFile, "Your alignment");
    auto fileInput = wrapFormElement("Input File", inputField);

    auto tableField = Input(&tableFile, "Your species table");
    auto tableInput = wrapFormElement("Species Table", tableField);

    int siteChoice = 0;
    std::vector<std::string> siteChoices = {
        "All Sites",
        "Transversions Only",
        "Transitions Only"
    };
    auto siteBoxes = Radiobox(&siteChoices, &siteChoice);
    auto siteInput = wrapFormElement("Bi-allelic Sites", siteBoxes);

    std::string maxSnpString = "";
    auto maxSnpField = Input(&maxSnpString, "No maximum");
    auto maxSnpInput = wrapFormElement("Maximum SNPs", maxSnpField);

    std::string seedString = "";
    auto seedField = Input(&seedString, "Random");
    auto seedInput = wrapFormElement("RNG Seed", seedField);

    auto annotationBox = Checkbox("", &noAnnotation);
    auto annotationInput = wrapFormElement("Skip Annotation", annotationBox);

    auto nexField = Input(&nexFile, "snapp.nex");
    auto nexInput = wrapFormElement("Output File", nexField);

    auto onSumbit = [&] {
        phylipFile = (usingVcf == 0) ? inputFile : "";
        vcfFile = (usingVcf == 1) ? inputFile : "";
        transversionsOnly = (siteChoice == 1);
        transitionsOnly = (siteChoice == 2);

        maxSnps = 0;
        if(!maxSnpString.empty()){
            try {
                maxSnps = boost::lexical_cast<int>(maxSnpString);
            }
            catch(const boost::bad_lexical_cast&) {
                errorMessage = "Maximum SNPs is an int";
                return;
            }
        }

        setSeed = !seedString.empty();
        if(setSeed){
            try {
                seed = boost::lexical_cast<unsigned int>(seedString);
            }
            catch(const boost::bad_lexical_cast&) {
                errorMessage = "Seed is an unsigned int";
                return;
            }
        }

        errorMessage = validate();
        if(!errorMessage.empty())
            return;

        submitted = true;
        screen.Exit();
    };
    auto exitButton = Button("Save and Run", onSumbit);


    auto layout = Container::Vertical({
        formatInput,
        fileInput,
        tableInput,
        siteInput,
        maxSnpInput,
        seedInput,
        annotationInput,
        nexInput,
        exitButton
    });

    // Wrap visual rendering
    auto renderer = Renderer(layout, [&] {
        Elements bannerElements = {
            text(""),
            text("  A C G T R Y  "),
            text("  | | | | | |  "),
            text("  0 1 2 0 - 2  "),
            text(""),
            separator(),
        };

        if(!errorMessage.empty()){
            bannerElements.push_back(
                paragraph(errorMessage) | color(Color::Red) | bold
            );
        }

        return hbox({
            vbox({
                bannerElements
            }) | size(WIDTH, LESS_THAN, 30) | border,
            vbox({
                text("SnappPrep Interactive Menu") | bold,
                separator(),
                formatInput->Render(),
                fileInput->Render(),
                tableInput->Render(),
                siteInput->Render(),
                maxSnpInput->Render(),
                seedInput->Render(),
                annotationInput->Render(),
                nexInput->Render(),
                separator(),
                exitButton->Render() | xflex_grow
            }) | xflex | size(WIDTH, GREATER_THAN, 50) | border
        });
    });

    screen.Loop(renderer);

    if(!submitted)
        std::exit(0);
}
#endif

Settings::Settings(int argc, char* argv[]){

    std::vector<std::string> arguments;
    for(int i = 1; i < argc; i++){
        std::string arg = argv[i];
        arguments.push_back(arg);
    }

    static const std::map<std::string, std::string> shortForms{
        {"--phylip", "-p"},
        {"--vcf", "-v"},
        {"--table", "-t"},
        {"--max-snps", "-m"},
        {"--transversions", "-r"},
        {"--transitions", "-i"},
        {"--nex", "-x"},
        {"--no-annotation", "-n"},
        {"--seed", "-s"},
        {"--help", "-h"},
    };

    std::string lastArgument; // Set while an option is waiting for its value
    for(const auto& raw : arguments){

        if(lastArgument == "-p"){
            phylipFile = raw;
        }
        else if(lastArgument == "-v"){
            vcfFile = raw;
        }
        else if(lastArgument == "-t"){
            tableFile = raw;
        }
        else if(lastArgument == "-x"){
            nexFile = raw;
        }
        else if(lastArgument == "-m"){
            try {
                maxSnps = boost::lexical_cast<int>(raw);
            }
            catch(const boost::bad_lexical_cast&) {
                usage();
                Msg::error("-m is supposed to be a positive integer representing the maximum number of SNPs.");
            }

            if(maxSnps <= 0){
                usage();
                Msg::error("-m is supposed to be a positive integer representing the maximum number of SNPs.");
            }
        }
        else if(lastArgument == "-s"){
            try {
                seed = boost::lexical_cast<unsigned int>(raw);
                setSeed = true;
            }
            catch(const boost::bad_lexical_cast&) {
                usage();
                Msg::error("-s is supposed to be a numeric (unsigned int) seed.");
            }
        }

        if(!lastArgument.empty()){
            lastArgument.clear();
            continue;
        }

        auto longForm = shortForms.find(raw);
        std::string arg = (longForm == shortForms.end()) ? raw : longForm->second;

        if(arg == "-r"){
            transversionsOnly = true;
        }
        else if(arg == "-i"){
            transitionsOnly = true;
        }
        else if(arg == "-n"){
            noAnnotation = true;
        }
        else if(arg == "-h" || arg == "-help"){
            usage();
            std::exit(0);
        }
        else if(arg == "-p" || arg == "-v" || arg == "-t" || arg == "-x" || arg == "-m" || arg == "-s"){
            lastArgument = arg;
        }
        else{
            usage();
            Msg::error("Unrecognized argument " + raw);
        }
    }

    if(!lastArgument.empty()){
        usage();
        Msg::error("Option " + lastArgument + " expects a value.");
    }

    std::string problem = validate();
    if(!problem.empty()){
        usage();
        Msg::error(problem);
    }
}

std::string Settings::validate() const {
    if(phylipFile.empty() && vcfFile.empty())
        return "An input file must be provided, either in phylip format with option '-p' or in vcf format with option '-v'!";

    if(!phylipFile.empty() && !vcfFile.empty())
        return "Only one of the two options '-p' and '-v' can be used!";

    if(transversionsOnly && transitionsOnly)
        return "Only one of the two options '-r' and '-i' can be used!";

    if(maxSnps < 0)
        return "-m is supposed to be a positive integer representing the maximum number of SNPs.";

    if(tableFile.empty())
        return "A species table must be provided with option '-t'!";

    if(nexFile.empty())
        return "An output file must be provided with option '-x'!";

    return "";
}

SiteMode Settings::getSiteMode() const {
    if(transversionsOnly)
        return SiteMode::TRANSVERSIONS_ONLY;
    if(transitionsOnly)
        return SiteMode::TRANSITIONS_ONLY;
    return SiteMode::ALL;
}

void Settings::usage(){
    std::cout << "Minimum SnappPrep Usage:\n";
    std::cout << "\tsnapprep -p <phylip_file> -t <species_table>\n";
    std::cout << "\tsnapprep -v <vcf_file> -t <species_table>\n";
    std::cout << "SnappPrep Command Line Arguments:\n";
    std::cout << "\t-p, --phylip <file>        File with SNP data in phylip format.\n";
    std::cout << "\t-v, --vcf <file>           File with SNP data in vcf format.\n";
    std::cout << "\t-t, --table <file>         File with table linking species and specimens (default: example.spc.txt).\n";
    std::cout << "\t-m, --max-snps <number>    Maximum number of SNPs to be used (default: no maximum).\n";
    std::cout << "\t-r, --transversions        Use transversions only.\n";
    std::cout << "\t-i, --transitions          Use transitions only.\n";
    std::cout << "\t-x, --nex <file>           Output file in NEX format (default: snapp.nex).\n";
    std::cout << "\t-n, --no-annotation        Do not write the provenance comment into the NEX file.\n";
    std::cout << "\t-s, --seed <seed>          Specify the RNG seed. Set this if you want to reproduce a run!\n";
    std::cout << "\t-h, --help                 Print this help text.\n";

    std::cout << std::flush;
}
