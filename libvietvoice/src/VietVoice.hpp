#ifndef VIETVOICE_H
#define VIETVOICE_H

#include "Assembler.hpp"
#include "Config.hpp"
#include "Errors.hpp"
#include "FileManager.hpp"
#include "JobStore.hpp"
#include "OnnxSynthesizer.hpp"
#include "Pipeline.hpp"
#include "ReferenceCatalog.hpp"
#include "SegmentSynthesizer.hpp"
#include "Segmenter.hpp"
#include "TextNormalizer.hpp"
#include "VoiceParameters.hpp"
#include "WavFile.hpp"

#endif // VIETVOICE_H
