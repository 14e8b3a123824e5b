#include "analysis/CapSampler.hpp"
#include "analysis/Diagnostics.hpp"
#include "analysis/FormatClassifier.hpp"
#include "analysis/SiteRecoder.hpp"
#include "analysis/SpeciesFilter.hpp"
#include "core/Alignment.hpp"
#include "core/FilterReport.hpp"
#include "core/InputSource.hpp"
#include "core/Msg.hpp"
#include "core/NexusWriter.hpp"
#include "core/Settings.hpp"
#include "core/SpeciesTable.hpp"
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/random_device.hpp>
#include <iostream>

int main(int argc, char* argv[]){
    std::cout << "\nSnappPrep\n\n***************************************************\n" << std::endl;

    #ifdef USE_UI
    Settings settings = (argc <= 1)
                        ? Settings()
                        : Settings(argc, argv);
    #else
    if(argc <= 1){
        Settings::usage();
        return 0;
    }
    Settings settings = Settings(argc, argv);
    #endif

    if(!settings.setSeed){
        boost::random::random_device device;
        settings.seed = device();
    }

    // Separate engines so that the cap sample does not depend on how many polarities were drawn
    boost::random::mt19937 polarityRng{settings.seed};
    boost::random::mt19937 capRng{settings.seed + 1};

    InputSource source = settings.vcfFile.empty()
                         ? InputSource{PhylipSource{settings.phylipFile}}
                         : InputSource{VcfSource{settings.vcfFile}};

    FilterReport report{};
    Alignment aln = normalizeInput(source, report);
    SequenceFormat format = FormatClassifier::classify(aln);

    std::cout << "Read " << aln.getNumTaxa() << " specimens with " << aln.getNumChar() << " sites from " << inputPath(source) << std::endl;

    SpeciesTable table(settings.tableFile);
    table.checkSpecimens(aln.getTaxaNames(), "file " + settings.tableFile);

    SiteRecoder recoder{polarityRng, settings.getSiteMode()};
    Alignment matrix = recoder(aln, format, report);

    SpeciesFilter speciesFilter{table};
    matrix = speciesFilter(matrix, report);

    if(settings.hasCap()){
        CapSampler sampler{capRng, settings.maxSnps};
        matrix = sampler(matrix, report);
    }

    std::cout << std::endl;
    for(const auto& w : Diagnostics::warnings(report, settings)){
        Msg::warning(w);
    }
    std::cout << std::endl;
    Msg::info(Diagnostics::info(report, settings, matrix.getNumChar()));
    std::cout << std::endl;

    std::string comment = settings.noAnnotation ? "" : NexusWriter::provenance(format, inputPath(source));
    NexusWriter::write(settings.nexFile, matrix, table, comment);
    std::cout << "Wrote SNAPP input in NEX format to file " << settings.nexFile << ".\n" << std::endl;

    return 0;
}
